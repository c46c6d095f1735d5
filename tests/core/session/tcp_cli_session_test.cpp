#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "core/session/tcp_cli_session.hpp"
#include "mongoose.h"
#include "support/test_helpers.hpp"

using netbatch::core::session::ExecStatus;
using netbatch::core::session::TcpCliSession;
using namespace std::chrono_literals;

namespace {

// Minimal line-oriented CLI on 127.0.0.1 with prompt "R1#".
//   show version -> two lines of output
//   slow         -> never answers
//   quit         -> closes the connection
//   anything else -> "% Invalid input"
class FakeCliServer {
public:
  FakeCliServer() {
    mg_mgr_init(&mgr_);
    listener_ = mg_listen(&mgr_, "tcp://127.0.0.1:0", Handler, this);
    if (listener_ != nullptr) port_ = mg_ntohs(listener_->loc.port);
    thread_ = std::thread([this] {
      while (running_.load()) mg_mgr_poll(&mgr_, 5);
    });
  }

  ~FakeCliServer() {
    running_.store(false);
    thread_.join();
    mg_mgr_free(&mgr_);
  }

  std::uint16_t Port() const { return port_; }
  int Accepted() const { return accepted_.load(); }

private:
  static void Handler(struct mg_connection* c, int ev, void*) {
    auto* self = static_cast<FakeCliServer*>(c->fn_data);
    if (ev == MG_EV_ACCEPT) {
      ++self->accepted_;
      Send(c, "Welcome to the lab\r\nR1#");
    } else if (ev == MG_EV_READ) {
      for (;;) {
        const std::string buf(reinterpret_cast<const char*>(c->recv.buf), c->recv.len);
        const auto nl = buf.find('\n');
        if (nl == std::string::npos) break;
        std::string line = buf.substr(0, nl);
        mg_iobuf_del(&c->recv, 0, nl + 1);
        while (!line.empty() && line.back() == '\r') line.pop_back();
        Respond(c, line);
      }
    }
  }

  static void Respond(struct mg_connection* c, const std::string& line) {
    if (line == "slow") return;
    if (line == "quit") {
      c->is_draining = 1;
      return;
    }
    if (line == "show version") {
      Send(c, line + "\r\nNetbatch OS 1.0\r\nuptime 5 days\r\nR1#");
      return;
    }
    Send(c, line + "\r\n% Invalid input\r\nR1#");
  }

  static void Send(struct mg_connection* c, const std::string& s) { mg_send(c, s.data(), s.size()); }

  struct mg_mgr mgr_{};
  struct mg_connection* listener_ = nullptr;
  std::uint16_t port_ = 0;
  std::atomic<bool> running_{true};
  std::atomic<int> accepted_{0};
  std::thread thread_;
};

std::unique_ptr<TcpCliSession> MakeSession(const std::string& address) {
  auto d = netbatch::testing::MakeDevice("R1");
  d.address = address;
  return std::make_unique<TcpCliSession>(d, TcpCliSession::Options{}, nullptr);
}

std::string LocalAddress(const FakeCliServer& server) {
  return "127.0.0.1:" + std::to_string(server.Port());
}

}  // namespace

TEST(TcpCliSession, DetectsPromptOnLastLine) {
  const std::vector<std::string> suffixes{"#", ">"};
  EXPECT_TRUE(TcpCliSession::EndsWithPrompt("output\r\nR1#", suffixes));
  EXPECT_TRUE(TcpCliSession::EndsWithPrompt("R1> ", suffixes));
  EXPECT_FALSE(TcpCliSession::EndsWithPrompt("R1#\r\nmore output\r\n", suffixes));
  EXPECT_FALSE(TcpCliSession::EndsWithPrompt("", suffixes));
}

TEST(TcpCliSession, CleanOutputStripsEchoAndPrompt) {
  EXPECT_EQ(TcpCliSession::CleanOutput("show clock\r\n12:00:00 UTC\r\nR1#", "show clock"),
            "12:00:00 UTC");
  EXPECT_EQ(TcpCliSession::CleanOutput("line a\nline b\nR1#", "show x"), "line a\nline b");
  EXPECT_EQ(TcpCliSession::CleanOutput("R1#", "show x"), "");
}

TEST(TcpCliSession, ExecutesAgainstLiveListener) {
  FakeCliServer server;
  if (server.Port() == 0) GTEST_SKIP() << "listener did not report its port";

  auto s = MakeSession(LocalAddress(server));
  std::string err;
  ASSERT_TRUE(s->Open(2s, err)) << err;
  EXPECT_TRUE(s->IsOpen());

  auto out = s->Execute("show version", 2s);
  ASSERT_EQ(out.status, ExecStatus::Ok) << out.error;
  EXPECT_EQ(out.output, "Netbatch OS 1.0\nuptime 5 days");

  out = s->Execute("show bogus", 2s);
  ASSERT_EQ(out.status, ExecStatus::Ok);
  EXPECT_EQ(out.output, "% Invalid input");

  s->Close();
  EXPECT_FALSE(s->IsOpen());
  EXPECT_EQ(server.Accepted(), 1);
}

TEST(TcpCliSession, SilentDeviceTimesOut) {
  FakeCliServer server;
  if (server.Port() == 0) GTEST_SKIP() << "listener did not report its port";

  auto s = MakeSession(LocalAddress(server));
  std::string err;
  ASSERT_TRUE(s->Open(2s, err)) << err;

  const auto start = std::chrono::steady_clock::now();
  const auto out = s->Execute("slow", 150ms);
  EXPECT_EQ(out.status, ExecStatus::Timeout);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 150ms);
}

TEST(TcpCliSession, PeerCloseIsIoError) {
  FakeCliServer server;
  if (server.Port() == 0) GTEST_SKIP() << "listener did not report its port";

  auto s = MakeSession(LocalAddress(server));
  std::string err;
  ASSERT_TRUE(s->Open(2s, err)) << err;

  const auto out = s->Execute("quit", 2s);
  EXPECT_EQ(out.status, ExecStatus::IoError);
  EXPECT_FALSE(s->IsOpen());
  EXPECT_EQ(s->Execute("show version", 1s).status, ExecStatus::IoError);
}

TEST(TcpCliSession, OpenFailsOnBadAddress) {
  auto s = MakeSession("[::1");
  std::string err;
  EXPECT_FALSE(s->Open(200ms, err));
  EXPECT_NE(err.find("invalid device address"), std::string::npos);
}
