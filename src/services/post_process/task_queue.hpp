#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/batch/cancellation.hpp"
#include "core/common/logger/logger.hpp"

namespace netbatch::services::post_process {

class TaskQueue {
public:
  using Task = std::function<void(const core::batch::CancellationToken&)>;

  explicit TaskQueue(std::string name = "tasks",
                     std::shared_ptr<core::common::log::Logger> logger = nullptr);
  ~TaskQueue();

  TaskQueue(const TaskQueue&) = delete;
  TaskQueue& operator=(const TaskQueue&) = delete;

  bool Start();
  // drain: run everything already queued first. Otherwise queued tasks are dropped
  // and the running one sees StopRequested().
  void Stop(bool drain = true);

  bool Post(Task task);

  void WaitIdle();
  bool WaitIdle(std::chrono::milliseconds timeout);

  std::size_t Pending() const;
  bool IsRunning() const;
  std::uint64_t Completed() const;
  std::uint64_t Failed() const;

private:
  void WorkerLoop();
  bool IdleLocked() const { return queue_.empty() && !busy_; }

private:
  std::string name_;
  std::shared_ptr<core::common::log::Logger> logger_;

  mutable std::mutex mu_;
  std::condition_variable work_cv_;
  std::condition_variable idle_cv_;
  std::deque<Task> queue_;
  bool running_ = false;
  bool stopping_ = false;
  bool busy_ = false;
  std::uint64_t completed_ = 0;
  std::uint64_t failed_ = 0;
  core::batch::CancellationToken token_;
  std::thread worker_;
};

}  // namespace netbatch::services::post_process
