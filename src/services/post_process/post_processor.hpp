#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/batch/batch_types.hpp"
#include "core/common/logger/logger.hpp"
#include "services/post_process/task_queue.hpp"
#include "services/result_sink/result_sink.hpp"

namespace netbatch::services::post_process {

struct PostProcessStats {
  std::uint64_t submitted = 0;
  std::uint64_t persisted = 0;
  std::uint64_t persist_failures = 0;
  std::uint64_t analyzer_failures = 0;
};

// Persists finished batches and runs analyzers over them on a TaskQueue.
class PostProcessor {
public:
  using Analyzer = std::function<void(const core::batch::BatchResult&,
                                      const result_sink::PersistReceipt&)>;

  PostProcessor(std::shared_ptr<result_sink::ResultSink> sink, std::shared_ptr<TaskQueue> queue,
                std::shared_ptr<core::common::log::Logger> logger = nullptr);

  PostProcessor(const PostProcessor&) = delete;
  PostProcessor& operator=(const PostProcessor&) = delete;

  void AddAnalyzer(std::string name, Analyzer analyzer);

  bool Submit(std::shared_ptr<const core::batch::BatchResult> result, std::string category);

  PostProcessStats Stats() const;

private:
  void Process(const core::batch::BatchResult& result, const std::string& category,
               const core::batch::CancellationToken& token);

private:
  std::shared_ptr<result_sink::ResultSink> sink_;
  std::shared_ptr<TaskQueue> queue_;
  std::shared_ptr<core::common::log::Logger> logger_;

  mutable std::mutex mu_;
  std::vector<std::pair<std::string, Analyzer>> analyzers_;
  PostProcessStats stats_;
};

}  // namespace netbatch::services::post_process
