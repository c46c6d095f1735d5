#include "core/common/logger/logger.hpp"

#include <system_error>
#include <utility>

namespace netbatch::core::common::log {

FileSink::FileSink(std::filesystem::path file_path) : file_path_(std::move(file_path)) {}

std::filesystem::path FileSink::Path() const {
  std::lock_guard<std::mutex> lk(mu_);
  return file_path_;
}

bool FileSink::EnsureOpen() {
  if (ofs_.is_open() && ofs_.good()) return true;
  if (ofs_.is_open()) ofs_.close();
  ofs_.clear();

  std::error_code ec;
  const auto dir = file_path_.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);

  ofs_.open(file_path_, std::ios::out | std::ios::app);
  return ofs_.is_open();
}

void FileSink::Write(const Event& e) {
  const std::string line = FormatLine(e);
  std::lock_guard<std::mutex> lk(mu_);
  if (!EnsureOpen()) return;
  ofs_ << line;
  if (e.level >= Level::Error) ofs_.flush();
}

void FileSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  if (ofs_.is_open()) ofs_.flush();
}

StreamSink::StreamSink(std::ostream& os) : os_(os) {}

void StreamSink::Write(const Event& e) {
  const std::string line = FormatLine(e);
  std::lock_guard<std::mutex> lk(mu_);
  os_ << line;
}

void StreamSink::Flush() {
  std::lock_guard<std::mutex> lk(mu_);
  os_.flush();
}

}  // namespace netbatch::core::common::log
