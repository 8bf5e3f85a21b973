#include "internal/core/uplink_telemetry.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

#include "tests/support/uplink_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using uplink::core::UplinkTelemetry;
using uplink::testing::ManualClock;

void TestCountersAccumulateUntilIntervalElapses() {
  ManualClock     clock;
  UplinkTelemetry telemetry(30s, [&] { return clock.Now(); });

  telemetry.RecordUplinked(4);
  telemetry.RecordAbandoned(2);
  telemetry.RecordUplinked(1);

  clock.Advance(29s);
  assert(!telemetry.MaybeFlush());
  assert(telemetry.uplinked() == 5);
  assert(telemetry.abandoned() == 2);
}

void TestFlushResetsCountersOncePerInterval() {
  ManualClock     clock;
  UplinkTelemetry telemetry(30s, [&] { return clock.Now(); });

  telemetry.RecordUplinked(7);
  telemetry.RecordAbandoned(3);

  clock.Advance(30s);
  assert(telemetry.MaybeFlush());
  assert(telemetry.uplinked() == 0);
  assert(telemetry.abandoned() == 0);

  // the next window starts at the flush
  telemetry.RecordAbandoned(1);
  clock.Advance(10s);
  assert(!telemetry.MaybeFlush());
  assert(telemetry.abandoned() == 1);

  clock.Advance(20s);
  assert(telemetry.MaybeFlush());
  assert(telemetry.abandoned() == 0);
}

void TestEmptyWindowStillAdvances() {
  ManualClock     clock;
  UplinkTelemetry telemetry(1s, [&] { return clock.Now(); });

  clock.Advance(5s);
  assert(telemetry.MaybeFlush());
  assert(!telemetry.MaybeFlush());
}

} // namespace

int main() {
  TestCountersAccumulateUntilIntervalElapses();
  TestFlushResetsCountersOncePerInterval();
  TestEmptyWindowStillAdvances();

  std::cout << "segment_uplink_unit_uplink_telemetry: pass\n";
  return 0;
}
