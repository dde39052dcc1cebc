#include "internal/runtime/one_shot_gate.hpp"

namespace semconv::runtime {

bool OneShotGate::Offer(const check::Verdict& verdict) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (verdict_) {
      return false;
    }
    verdict_ = verdict;
  }
  resolved_cv_.notify_all();
  return true;
}

std::optional<check::Verdict> OneShotGate::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  resolved_cv_.wait_for(lock, timeout, [this] { return verdict_.has_value(); });
  return verdict_;
}

bool OneShotGate::Resolved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verdict_.has_value();
}

} // namespace semconv::runtime
