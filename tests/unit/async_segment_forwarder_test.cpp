#include "internal/core/async_segment_forwarder.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "tests/support/uplink_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using uplink::buffer::BufferStrategy;
using uplink::buffer::DataCarrier;
using uplink::core::AsyncSegmentForwarder;
using uplink::segment::SegmentPtr;
using uplink::testing::MakeSegment;

struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> calls;

  AsyncSegmentForwarder::Sleeper Bind() {
    return [this](std::chrono::milliseconds delay) { calls.push_back(delay); };
  }
};

void TestReadySegmentsMoveToUploadAndUnfinishedStay() {
  DataCarrier<SegmentPtr> upload(1, 10, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 10, BufferStrategy::kBlocking);
  RecordingSleeper        sleeper;
  AsyncSegmentForwarder   forwarder(upload, async_buffer, 50ms, sleeper.Bind());

  std::vector<SegmentPtr> batch{MakeSegment("ready"), MakeSegment("pending", false)};
  forwarder.Consume(batch);

  assert(upload.Size() == 1);
  assert(async_buffer.Size() == 1);
  assert(sleeper.calls.size() == 1);
  assert(sleeper.calls.front() == 50ms);
}

void TestAllReadyBatchDoesNotPause() {
  DataCarrier<SegmentPtr> upload(1, 10, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 10, BufferStrategy::kBlocking);
  RecordingSleeper        sleeper;
  AsyncSegmentForwarder   forwarder(upload, async_buffer, 50ms, sleeper.Bind());

  std::vector<SegmentPtr> batch{MakeSegment("a"), MakeSegment("b"), MakeSegment("c")};
  forwarder.Consume(batch);

  assert(upload.Size() == 3);
  assert(async_buffer.Size() == 0);
  assert(sleeper.calls.empty());
}

void TestFullUploadCarrierDropsInsteadOfBlocking() {
  DataCarrier<SegmentPtr> upload(1, 1, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 10, BufferStrategy::kBlocking);
  assert(upload.Produce(MakeSegment("occupant")));

  RecordingSleeper      sleeper;
  AsyncSegmentForwarder forwarder(upload, async_buffer, 50ms, sleeper.Bind());

  std::vector<SegmentPtr> batch{MakeSegment("late")};
  const auto              start = std::chrono::steady_clock::now();
  forwarder.Consume(batch);

  assert(std::chrono::steady_clock::now() - start < 1s);
  assert(upload.Size() == 1);
  assert(async_buffer.Size() == 0);
}

void TestUnfinishedSegmentsAreHeldWhenAsyncBufferIsFull() {
  DataCarrier<SegmentPtr> upload(1, 10, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 2, BufferStrategy::kBlocking);
  assert(async_buffer.Produce(MakeSegment("redirected-1", false)));
  assert(async_buffer.Produce(MakeSegment("redirected-2", false)));

  RecordingSleeper      sleeper;
  AsyncSegmentForwarder forwarder(upload, async_buffer, 50ms, sleeper.Bind());

  auto                    a = MakeSegment("a", false);
  auto                    b = MakeSegment("b", false);
  std::vector<SegmentPtr> batch{a, b};
  const auto              start = std::chrono::steady_clock::now();
  forwarder.Consume(batch);

  // nothing blocked and all four unfinished segments are still somewhere
  assert(std::chrono::steady_clock::now() - start < 1s);
  assert(async_buffer.Size() == 2);
  assert(forwarder.HeldSegments() == 2);
  assert(sleeper.calls.size() == 1);

  a->SetReady(true);
  b->SetReady(true);
  std::vector<SegmentPtr> empty;
  forwarder.Consume(empty);

  assert(forwarder.HeldSegments() == 0);
  assert(upload.Size() == 2);
  assert(sleeper.calls.size() == 1);
}

void TestHeldReadySegmentsReachUploadOnExit() {
  DataCarrier<SegmentPtr> upload(1, 10, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 1, BufferStrategy::kBlocking);
  assert(async_buffer.Produce(MakeSegment("occupant", false)));

  RecordingSleeper      sleeper;
  AsyncSegmentForwarder forwarder(upload, async_buffer, 50ms, sleeper.Bind());

  auto                    pending = MakeSegment("pending", false);
  std::vector<SegmentPtr> batch{pending, MakeSegment("never-ready", false)};
  forwarder.Consume(batch);
  assert(forwarder.HeldSegments() == 2);

  pending->SetReady(true);
  forwarder.OnExit();

  assert(forwarder.HeldSegments() == 0);
  assert(upload.Size() == 1);
}

void TestSegmentIsForwardedOnceItBecomesReady() {
  DataCarrier<SegmentPtr> upload(1, 10, BufferStrategy::kIfPossible);
  DataCarrier<SegmentPtr> async_buffer(1, 10, BufferStrategy::kBlocking);

  auto uploaded = std::make_shared<uplink::testing::RecordingConsumer<SegmentPtr>>();
  upload.Consume(uploaded, 10, 5ms);
  async_buffer.Consume(std::make_shared<AsyncSegmentForwarder>(upload, async_buffer, 20ms), 10, 5ms);

  auto segment = MakeSegment("async", false);
  assert(async_buffer.Produce(segment));

  std::this_thread::sleep_for(150ms);
  assert(uploaded->Items().empty());

  segment->SetReady(true);
  assert(uploaded->WaitForCount(1, 2s));
  assert(uploaded->Items().front() == segment);

  async_buffer.ShutdownConsumers();
  upload.ShutdownConsumers();
  assert(uploaded->Items().size() == 1);
}

} // namespace

int main() {
  TestReadySegmentsMoveToUploadAndUnfinishedStay();
  TestAllReadyBatchDoesNotPause();
  TestFullUploadCarrierDropsInsteadOfBlocking();
  TestUnfinishedSegmentsAreHeldWhenAsyncBufferIsFull();
  TestHeldReadySegmentsReachUploadOnExit();
  TestSegmentIsForwardedOnceItBecomesReady();

  std::cout << "segment_uplink_unit_async_segment_forwarder: pass\n";
  return 0;
}
