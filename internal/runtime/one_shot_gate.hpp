#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

#include "internal/check/verdict.hpp"

namespace semconv::runtime {

/*
  OneShotGate

  Hand-off between the export handler and main() in one-shot mode.
  The first verdict offered wins; later offers are ignored. main() waits on
  the gate and turns the verdict into the process exit code.
*/
class OneShotGate {
 public:
  // Returns true when this offer was the first one.
  bool Offer(const check::Verdict& verdict);

  std::optional<check::Verdict> WaitFor(std::chrono::milliseconds timeout) const;

  bool Resolved() const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable resolved_cv_;
  std::optional<check::Verdict>   verdict_;
};

} // namespace semconv::runtime
