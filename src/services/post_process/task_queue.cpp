#include "services/post_process/task_queue.hpp"

#include <exception>
#include <utility>

namespace netbatch::services::post_process {

using core::common::log::Level;

TaskQueue::TaskQueue(std::string name, std::shared_ptr<core::common::log::Logger> logger)
    : name_(std::move(name)), logger_(std::move(logger)) {}

TaskQueue::~TaskQueue() { Stop(false); }

bool TaskQueue::Start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (running_) return false;
  running_ = true;
  stopping_ = false;
  token_ = core::batch::CancellationToken();
  worker_ = std::thread([this] { WorkerLoop(); });
  return true;
}

void TaskQueue::Stop(bool drain) {
  std::thread worker;
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_) return;
    stopping_ = true;
    if (!drain) {
      dropped = queue_.size();
      queue_.clear();
      token_.RequestStop();
    }
    worker = std::move(worker_);
  }
  work_cv_.notify_all();
  if (worker.joinable()) worker.join();

  {
    std::lock_guard<std::mutex> lk(mu_);
    running_ = false;
  }
  idle_cv_.notify_all();
  if (dropped > 0 && logger_) {
    logger_->Log(Level::Warn, name_, "dropped " + std::to_string(dropped) + " queued task(s)");
  }
}

bool TaskQueue::Post(Task task) {
  if (!task) return false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!running_ || stopping_) return false;
    queue_.push_back(std::move(task));
  }
  work_cv_.notify_one();
  return true;
}

void TaskQueue::WaitIdle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return IdleLocked() || !running_; });
}

bool TaskQueue::WaitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [this] { return IdleLocked() || !running_; });
}

std::size_t TaskQueue::Pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size() + (busy_ ? 1 : 0);
}

bool TaskQueue::IsRunning() const {
  std::lock_guard<std::mutex> lk(mu_);
  return running_ && !stopping_;
}

std::uint64_t TaskQueue::Completed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return completed_;
}

std::uint64_t TaskQueue::Failed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return failed_;
}

void TaskQueue::WorkerLoop() {
  for (;;) {
    Task task;
    core::batch::CancellationToken token;
    {
      std::unique_lock<std::mutex> lk(mu_);
      work_cv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
      if (queue_.empty()) break;
      task = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
      token = token_;
    }

    bool ok = true;
    try {
      task(token);
    } catch (const std::exception& e) {
      ok = false;
      if (logger_) logger_->Log(Level::Error, name_, std::string("task failed: ") + e.what());
    }

    {
      std::lock_guard<std::mutex> lk(mu_);
      busy_ = false;
      if (ok) {
        ++completed_;
      } else {
        ++failed_;
      }
    }
    idle_cv_.notify_all();
  }
}

}  // namespace netbatch::services::post_process
