// Repository: Moshline
// Component: Wait Strategy Interface
// Purpose: How the capture clock blocks until a frame deadline. The CLI
//          sleeps on the steady clock; tests substitute virtual time.
// Copyright (c) 2025 RetroVue

#ifndef MOSHLINE_CAPTURE_IWAIT_STRATEGY_HPP_
#define MOSHLINE_CAPTURE_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace moshline::capture {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Returns no earlier than `deadline`, or immediately if it has passed.
  virtual void WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::this_thread::sleep_until(deadline);
  }
};

}  // namespace moshline::capture

#endif  // MOSHLINE_CAPTURE_IWAIT_STRATEGY_HPP_
