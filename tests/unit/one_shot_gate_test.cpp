#include "internal/runtime/one_shot_gate.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using semconv::check::Verdict;
using semconv::runtime::OneShotGate;

void TestFirstOfferWins() {
  OneShotGate gate;
  assert(!gate.Resolved());

  assert(gate.Offer(Verdict{2, {"first"}}));
  assert(!gate.Offer(Verdict{0, {}}));
  assert(gate.Resolved());

  const auto verdict = gate.WaitFor(std::chrono::milliseconds(0));
  assert(verdict.has_value());
  assert(verdict->violation_count == 2);
  assert(verdict->implicated_scopes.front() == "first");
}

void TestWaitTimesOutWithoutOffer() {
  OneShotGate gate;
  assert(!gate.WaitFor(std::chrono::milliseconds(20)).has_value());
}

void TestWaiterWakesOnOffer() {
  OneShotGate gate;

  std::thread offerer([&gate] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    gate.Offer(Verdict{1, {"late"}});
  });

  const auto verdict = gate.WaitFor(std::chrono::seconds(5));
  offerer.join();

  assert(verdict.has_value());
  assert(verdict->violation_count == 1);
}

void TestConcurrentOffersResolveOnce() {
  constexpr int kThreads = 16;

  OneShotGate              gate;
  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  threads.reserve(kThreads);

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&gate, &winners, i] {
      if (gate.Offer(Verdict{i, {}})) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(winners.load() == 1);
  assert(gate.Resolved());
}

} // namespace

int main() {
  TestFirstOfferWins();
  TestWaitTimesOutWithoutOffer();
  TestWaiterWakesOnOffer();
  TestConcurrentOffersResolveOnce();

  std::cout << "semconv_unit_one_shot_gate: pass\n";
  return 0;
}
