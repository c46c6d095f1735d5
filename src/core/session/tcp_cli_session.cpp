#include "core/session/tcp_cli_session.hpp"

#include <utility>

#include "core/common/utils/network_utils.hpp"
#include "core/common/utils/string_utils.hpp"

namespace netbatch::core::session {

namespace net = common::net;
namespace str = common::str;

TcpCliSession::TcpCliSession(inventory::model::DeviceRef device, Options opt,
                             std::shared_ptr<common::log::Logger> logger)
    : device_(std::move(device)), opt_(std::move(opt)), logger_(std::move(logger)) {}

TcpCliSession::~TcpCliSession() { Close(); }

std::string TcpCliSession::Name() const { return "tcp_cli"; }

bool TcpCliSession::IsOpen() const { return conn_ != nullptr && connected_ && !closed_; }

bool TcpCliSession::Open(std::chrono::milliseconds timeout, std::string& err) {
  Close();

  const auto ep = net::ParseHostPort(device_.address, opt_.default_port);
  if (!ep) {
    err = "invalid device address '" + device_.address + "'";
    return false;
  }

  mg_mgr_init(&mgr_);
  mgr_ready_ = true;
  connected_ = false;
  closed_ = false;
  last_error_.clear();
  rx_.clear();

  const std::string url = "tcp://" + net::JoinHostPort(ep->host, ep->port);
  conn_ = mg_connect(&mgr_, url.c_str(), EventHandler, this);
  if (conn_ == nullptr) {
    err = "connect failed: " + url;
    Close();
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  PollUntil(deadline, [this] { return connected_ || closed_; });
  if (!connected_ || closed_) {
    err = last_error_.empty() ? "connect timed out: " + url : last_error_;
    Close();
    return false;
  }

  const bool prompt = PollUntil(deadline, [this] {
    return closed_ || EndsWithPrompt(rx_, opt_.prompt_suffixes);
  });
  if (closed_ || !prompt) {
    err = closed_ ? "connection closed before prompt" : "no CLI prompt from " + url;
    Close();
    return false;
  }

  rx_.clear();
  if (logger_) logger_->Debug("tcp session open: " + device_.name + " " + url);
  return true;
}

ExecOutcome TcpCliSession::Execute(const std::string& command, std::chrono::milliseconds timeout) {
  if (!IsOpen()) return ExecOutcome::Failed("session not open");

  rx_.clear();
  const std::string line = command + opt_.line_ending;
  if (!mg_send(conn_, line.data(), line.size())) {
    return ExecOutcome::Failed("send failed");
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  const bool done = PollUntil(deadline, [this] {
    return closed_ || EndsWithPrompt(rx_, opt_.prompt_suffixes);
  });

  if (closed_) {
    return ExecOutcome::Failed(last_error_.empty() ? "connection closed by peer" : last_error_);
  }
  if (!done) {
    return ExecOutcome::TimedOut("no prompt within " + std::to_string(timeout.count()) + "ms");
  }
  return ExecOutcome::Success(CleanOutput(rx_, command));
}

void TcpCliSession::Close() {
  if (conn_ != nullptr) {
    conn_->is_closing = 1;
    conn_ = nullptr;
  }
  if (mgr_ready_) {
    mg_mgr_free(&mgr_);
    mgr_ready_ = false;
  }
  connected_ = false;
  closed_ = true;
}

bool TcpCliSession::PollUntil(std::chrono::steady_clock::time_point deadline,
                              const std::function<bool()>& done) {
  while (!done()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    mg_mgr_poll(&mgr_, opt_.poll_interval_ms);
  }
  return true;
}

void TcpCliSession::EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<TcpCliSession*>(c->fn_data);
  if (self != nullptr) self->HandleEvent(c, ev, ev_data);
}

void TcpCliSession::HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
  if (ev == MG_EV_CONNECT) {
    connected_ = true;
  } else if (ev == MG_EV_READ) {
    rx_.append(c->recv.buf, c->recv.buf + c->recv.len);
    mg_iobuf_del(&c->recv, 0, c->recv.len);
  } else if (ev == MG_EV_ERROR) {
    const char* err = static_cast<const char*>(ev_data);
    last_error_ = std::string("socket error: ") + (err ? err : "unknown");
    if (logger_) logger_->Warn(device_.name + " " + last_error_);
  } else if (ev == MG_EV_CLOSE) {
    if (c == conn_) conn_ = nullptr;
    closed_ = true;
  }
}

bool TcpCliSession::EndsWithPrompt(const std::string& buf, const std::vector<std::string>& suffixes) {
  const auto nl = buf.find_last_of('\n');
  std::string_view last = (nl == std::string::npos) ? std::string_view(buf)
                                                    : std::string_view(buf).substr(nl + 1);
  while (!last.empty() && (last.back() == ' ' || last.back() == '\r')) last.remove_suffix(1);
  if (last.empty()) return false;
  for (const auto& s : suffixes) {
    if (!s.empty() && str::EndsWith(last, s)) return true;
  }
  return false;
}

std::string TcpCliSession::CleanOutput(const std::string& raw, const std::string& command) {
  std::string text;
  text.reserve(raw.size());
  for (const char c : raw) {
    if (c != '\r') text.push_back(c);
  }

  // Trailing prompt line.
  const auto nl = text.find_last_of('\n');
  text.erase(nl == std::string::npos ? 0 : nl);

  // Echoed command.
  const auto first_nl = text.find('\n');
  const std::string_view first = std::string_view(text).substr(0, first_nl);
  if (str::Trim(first) == str::Trim(command)) {
    text.erase(0, first_nl == std::string::npos ? text.size() : first_nl + 1);
  }

  while (!text.empty() && text.back() == '\n') text.pop_back();
  return text;
}

}  // namespace netbatch::core::session
