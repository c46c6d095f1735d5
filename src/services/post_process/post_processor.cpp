#include "services/post_process/post_processor.hpp"

#include <exception>

#include "core/common/utils/string_utils.hpp"

namespace netbatch::services::post_process {

using core::common::log::Level;

PostProcessor::PostProcessor(std::shared_ptr<result_sink::ResultSink> sink,
                             std::shared_ptr<TaskQueue> queue,
                             std::shared_ptr<core::common::log::Logger> logger)
    : sink_(std::move(sink)), queue_(std::move(queue)), logger_(std::move(logger)) {}

void PostProcessor::AddAnalyzer(std::string name, Analyzer analyzer) {
  if (!analyzer) return;
  std::lock_guard<std::mutex> lk(mu_);
  analyzers_.emplace_back(std::move(name), std::move(analyzer));
}

bool PostProcessor::Submit(std::shared_ptr<const core::batch::BatchResult> result,
                           std::string category) {
  if (!result || !sink_ || !queue_) return false;
  if (core::common::str::Trim(category).empty()) return false;

  const bool posted = queue_->Post(
      [this, result = std::move(result), category = std::move(category)](
          const core::batch::CancellationToken& token) { Process(*result, category, token); });
  if (posted) {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.submitted;
  } else if (logger_) {
    logger_->Log(Level::Warn, "post", "background queue is not running; result not persisted");
  }
  return posted;
}

PostProcessStats PostProcessor::Stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

void PostProcessor::Process(const core::batch::BatchResult& result, const std::string& category,
                            const core::batch::CancellationToken& token) {
  result_sink::PersistReceipt receipt;
  core::common::Error err;
  if (!sink_->Persist(result, category, receipt, err)) {
    if (logger_) {
      logger_->Log(Level::Error, "post", "persist " + result.run_id + "/" + category +
                                             " failed: " + err.ToString());
    }
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.persist_failures;
    return;
  }

  std::vector<std::pair<std::string, Analyzer>> analyzers;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.persisted;
    analyzers = analyzers_;
  }

  for (const auto& [name, analyzer] : analyzers) {
    if (token.StopRequested()) {
      if (logger_) logger_->Log(Level::Info, "post", "analysis of " + result.run_id + " cancelled");
      return;
    }
    try {
      analyzer(result, receipt);
    } catch (const std::exception& e) {
      if (logger_) {
        logger_->Log(Level::Error, "post", "analyzer " + name + " failed: " + e.what());
      }
      std::lock_guard<std::mutex> lk(mu_);
      ++stats_.analyzer_failures;
    }
  }
}

}  // namespace netbatch::services::post_process
