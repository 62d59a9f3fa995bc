#include "internal/backoff/backoff_controller.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "support/manual_clock.hpp"

namespace {

using namespace std::chrono_literals;
using bookrec::backoff::BackoffController;
using bookrec::backoff::BackoffPolicy;
using bookrec::backoff::ComputeBackoffDelay;

void TestDefaultScheduleDoublesThenCaps() {
  const BackoffPolicy policy;
  assert(ComputeBackoffDelay(0, policy) == 0ms);
  assert(ComputeBackoffDelay(1, policy) == 2s);
  assert(ComputeBackoffDelay(2, policy) == 4s);
  assert(ComputeBackoffDelay(3, policy) == 8s);
  assert(ComputeBackoffDelay(4, policy) == 16s);
  assert(ComputeBackoffDelay(5, policy) == 30s);
  assert(ComputeBackoffDelay(6, policy) == 30s);
  // no overflow for long outages
  assert(ComputeBackoffDelay(4000000000u, policy) == 30s);
}

void TestCustomPolicy() {
  BackoffPolicy policy;
  policy.initial_delay = 250ms;
  policy.max_delay     = 1s;
  assert(ComputeBackoffDelay(1, policy) == 250ms);
  assert(ComputeBackoffDelay(3, policy) == 1s);
}

void TestControllerGatesAttempts() {
  const auto        t0 = bookrec::test::ReferenceInstant();
  BackoffController controller;

  assert(controller.MayAttempt(t0));
  assert(!controller.next_retry_at());

  assert(controller.RecordFailure(t0) == 2s);
  assert(controller.consecutive_failures() == 1);
  assert(!controller.MayAttempt(t0 + 1999ms));
  assert(controller.MayAttempt(t0 + 2s));

  assert(controller.RecordFailure(t0 + 2s) == 4s);
  assert(*controller.next_retry_at() == t0 + 6s);

  controller.RecordSuccess();
  assert(controller.consecutive_failures() == 0);
  assert(!controller.next_retry_at());
  assert(controller.MayAttempt(t0 + 2s));
}

} // namespace

int main() {
  TestDefaultScheduleDoublesThenCaps();
  TestCustomPolicy();
  TestControllerGatesAttempts();

  std::cout << "booking_recorder_unit_backoff_controller: pass\n";
  return 0;
}
