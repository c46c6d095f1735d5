#pragma once

#include <atomic>
#include <memory>

namespace netbatch::core::batch {

// Cooperative stop flag. Copies share state; RequestStop may be called from any thread.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void RequestStop() { flag_->store(true, std::memory_order_release); }
  bool StopRequested() const { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace netbatch::core::batch
