#include "internal/core/segment_uplink_consumer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "tests/support/uplink_fakes.hpp"

namespace {

using namespace std::chrono_literals;
using uplink::buffer::BufferStrategy;
using uplink::buffer::DataCarrier;
using uplink::channel::ChannelStatus;
using uplink::core::ChannelStatusTracker;
using uplink::core::SegmentUplinkConsumer;
using uplink::core::UplinkTelemetry;
using uplink::segment::SegmentPtr;
using uplink::testing::FakeChannelManager;
using uplink::testing::FakeCollectorStub;
using uplink::testing::MakeSegment;

/*
  One consumer wired to a fake channel manager and a scripted stub.
*/
struct Fixture {
  explicit Fixture(std::shared_ptr<FakeCollectorStub> collector_stub, std::chrono::milliseconds timeout = 2s)
      : stub(std::move(collector_stub)),
        tracker(manager, [this](std::shared_ptr<::grpc::Channel>) { return std::static_pointer_cast<uplink::transport::CollectorStub>(stub); }),
        async_buffer(1, 16, BufferStrategy::kBlocking),
        consumer(tracker, manager, async_buffer, timeout, UplinkTelemetry(std::chrono::hours(1))) {
    manager.SetChannel(uplink::testing::MakeUnusedChannel());
  }

  void Connect() {
    tracker.StatusChanged(ChannelStatus::kConnected);
  }

  std::shared_ptr<FakeCollectorStub> stub;
  FakeChannelManager                 manager;
  ChannelStatusTracker               tracker;
  DataCarrier<SegmentPtr>            async_buffer;
  SegmentUplinkConsumer              consumer;
};

std::vector<SegmentPtr> ReadyBatch(int count) {
  std::vector<SegmentPtr> batch;
  for (int i = 0; i < count; ++i) {
    batch.push_back(MakeSegment("segment-" + std::to_string(i)));
  }
  return batch;
}

void TestDisconnectedBatchIsAbandonedWithoutIo() {
  Fixture fixture(std::make_shared<FakeCollectorStub>());

  auto batch = ReadyBatch(4);
  fixture.consumer.Consume(batch);

  assert(fixture.consumer.telemetry().abandoned() == 4);
  assert(fixture.consumer.telemetry().uplinked() == 0);
  assert(fixture.stub->CollectCalls() == 0);
}

void TestCompletedStreamCountsEverySentSegment() {
  Fixture fixture(std::make_shared<FakeCollectorStub>());
  fixture.Connect();

  auto batch = ReadyBatch(4);
  fixture.consumer.Consume(batch);

  assert(fixture.stub->CollectCalls() == 1);
  const auto written = fixture.stub->WrittenTraceIds();
  assert(written.size() == 4);
  assert(written.front() == "segment-0" && written.back() == "segment-3");
  assert(fixture.consumer.telemetry().uplinked() == 4);
  assert(fixture.consumer.telemetry().abandoned() == 0);
}

void TestLateCompletionIsNeverCounted() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kCompleteLate, 300ms), 50ms);
  fixture.Connect();

  auto batch = ReadyBatch(3);
  fixture.consumer.Consume(batch);
  assert(fixture.consumer.telemetry().uplinked() == 0);

  fixture.stub->JoinLateCompletions();
  assert(fixture.consumer.telemetry().uplinked() == 0);
  assert(fixture.consumer.telemetry().abandoned() == 0);
}

void TestTransformFailureSkipsOnlyThatSegment() {
  Fixture fixture(std::make_shared<FakeCollectorStub>());
  fixture.Connect();

  auto broken = MakeSegment("broken");
  broken->FailTransform();
  std::vector<SegmentPtr> batch{MakeSegment("first"), broken, MakeSegment("last")};
  fixture.consumer.Consume(batch);

  const auto written = fixture.stub->WrittenTraceIds();
  assert(written.size() == 2);
  assert(written[0] == "first" && written[1] == "last");
  assert(fixture.consumer.telemetry().uplinked() == 2);
}

void TestUnfinishedSegmentIsMovedToAsyncBuffer() {
  Fixture fixture(std::make_shared<FakeCollectorStub>());
  fixture.Connect();

  std::vector<SegmentPtr> batch{MakeSegment("ready"), MakeSegment("pending", false)};
  fixture.consumer.Consume(batch);

  assert(fixture.stub->WrittenCount() == 1);
  assert(fixture.async_buffer.Size() == 1);
  assert(fixture.consumer.telemetry().uplinked() == 1);
}

void TestStreamErrorIsReportedToChannelManager() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kError));
  fixture.Connect();

  auto batch = ReadyBatch(2);
  fixture.consumer.Consume(batch);

  const auto reported = fixture.manager.Reported();
  assert(reported.size() == 1);
  assert(reported.front() == ::grpc::StatusCode::UNAVAILABLE);
  // a failed stream still ends the wait; the attempt is counted
  assert(fixture.consumer.telemetry().uplinked() == 2);
}

void TestBatchWithNothingToSendDoesNotWait() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kNever), 5s);
  fixture.Connect();

  std::vector<SegmentPtr> batch{MakeSegment("pending-a", false), MakeSegment("pending-b", false)};
  const auto              start = std::chrono::steady_clock::now();
  fixture.consumer.Consume(batch);

  assert(std::chrono::steady_clock::now() - start < 1s);
  assert(fixture.async_buffer.Size() == 2);
  assert(fixture.consumer.telemetry().uplinked() == 0);
}

void TestDisconnectAfterConnectAbandonsAgain() {
  Fixture fixture(std::make_shared<FakeCollectorStub>());
  fixture.Connect();
  fixture.tracker.StatusChanged(ChannelStatus::kDisconnected);

  auto batch = ReadyBatch(5);
  fixture.consumer.Consume(batch);

  assert(fixture.stub->CollectCalls() == 0);
  assert(fixture.consumer.telemetry().abandoned() == 5);
}

void TestLateErrorWhileRunningIsReported() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kErrorLate, 200ms), 20ms);
  fixture.Connect();

  auto batch = ReadyBatch(2);
  fixture.consumer.Consume(batch);
  assert(fixture.consumer.telemetry().uplinked() == 0);

  fixture.stub->JoinLateCompletions();
  assert(fixture.manager.Reported().size() == 1);
}

void TestLateErrorAfterExitLeavesManagerAlone() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kErrorLate, 200ms), 20ms);
  fixture.Connect();

  auto batch = ReadyBatch(2);
  fixture.consumer.Consume(batch);
  fixture.consumer.OnExit();

  fixture.stub->JoinLateCompletions();
  assert(fixture.manager.Reported().empty());
}

void TestLateErrorAfterTeardownDoesNotTouchManager() {
  auto stub    = std::make_shared<FakeCollectorStub>(FakeCollectorStub::Outcome::kErrorLate, 200ms);
  auto manager = std::make_unique<FakeChannelManager>();
  manager->SetChannel(uplink::testing::MakeUnusedChannel());

  {
    ChannelStatusTracker tracker(*manager, [&](std::shared_ptr<::grpc::Channel>) {
      return std::static_pointer_cast<uplink::transport::CollectorStub>(stub);
    });
    DataCarrier<SegmentPtr> async_buffer(1, 16, BufferStrategy::kBlocking);
    auto consumer = std::make_shared<SegmentUplinkConsumer>(tracker, *manager, async_buffer, 20ms, UplinkTelemetry(std::chrono::hours(1)));
    tracker.StatusChanged(ChannelStatus::kConnected);

    auto batch = ReadyBatch(3);
    consumer->Consume(batch);
    assert(consumer->telemetry().uplinked() == 0);
  }
  manager.reset();

  // the stream fails only now, after the consumer and the manager are gone
  stub->JoinLateCompletions();
  assert(stub->WrittenCount() == 3);
}

void TestRefusedStreamCountsBatchAsAbandoned() {
  auto stub = std::make_shared<FakeCollectorStub>();
  stub->ThrowOnCollect();
  Fixture fixture(stub);
  fixture.Connect();

  auto batch = ReadyBatch(3);
  fixture.consumer.Consume(batch);

  assert(fixture.stub->CollectCalls() == 1);
  assert(fixture.consumer.telemetry().abandoned() == 3);
  assert(fixture.consumer.telemetry().uplinked() == 0);
}

void TestStreamCarriesDeadlineBeyondCompletionWait() {
  Fixture fixture(std::make_shared<FakeCollectorStub>(), 2s);
  fixture.Connect();

  const auto before = std::chrono::system_clock::now();
  auto       batch  = ReadyBatch(1);
  fixture.consumer.Consume(batch);
  const auto after = std::chrono::system_clock::now();

  const auto deadline = fixture.stub->LastDeadline();
  assert(deadline >= before + 4s);
  assert(deadline <= after + 4s);
}

} // namespace

int main() {
  TestDisconnectedBatchIsAbandonedWithoutIo();
  TestCompletedStreamCountsEverySentSegment();
  TestLateCompletionIsNeverCounted();
  TestTransformFailureSkipsOnlyThatSegment();
  TestUnfinishedSegmentIsMovedToAsyncBuffer();
  TestStreamErrorIsReportedToChannelManager();
  TestBatchWithNothingToSendDoesNotWait();
  TestDisconnectAfterConnectAbandonsAgain();
  TestLateErrorWhileRunningIsReported();
  TestLateErrorAfterExitLeavesManagerAlone();
  TestLateErrorAfterTeardownDoesNotTouchManager();
  TestRefusedStreamCountsBatchAsAbandoned();
  TestStreamCarriesDeadlineBeyondCompletionWait();

  std::cout << "segment_uplink_unit_segment_uplink_consumer: pass\n";
  return 0;
}
