#include "segment_uplink_consumer.hpp"

#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/transport/stream_status.hpp"

namespace uplink::core {

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kStreamDeadlineFactor = 2;

} // namespace

/*
  Shared with in-flight stream callbacks. Detach() waits for a report that
  is already running, so the manager is not used once it returns.
*/
class SegmentUplinkConsumer::ErrorReporter {
 public:
  explicit ErrorReporter(channel::ChannelManager& manager) : manager_(&manager) {
  }

  void Report(const ::grpc::Status& status) {
    std::lock_guard lock(mutex_);
    if (manager_ != nullptr) manager_->ReportError(status);
  }

  void Detach() {
    std::lock_guard lock(mutex_);
    manager_ = nullptr;
  }

 private:
  std::mutex               mutex_;
  channel::ChannelManager* manager_;
};

SegmentUplinkConsumer::SegmentUplinkConsumer(const ChannelStatusTracker& tracker, channel::ChannelManager& manager,
                                             buffer::DataCarrier<segment::SegmentPtr>& async_buffer,
                                             std::chrono::milliseconds completion_timeout, UplinkTelemetry telemetry)
    : tracker_(tracker),
      reporter_(std::make_shared<ErrorReporter>(manager)),
      async_buffer_(async_buffer),
      completion_timeout_(completion_timeout),
      telemetry_(std::move(telemetry)) {
}

SegmentUplinkConsumer::~SegmentUplinkConsumer() {
  reporter_->Detach();
}

void SegmentUplinkConsumer::Consume(std::vector<segment::SegmentPtr>& batch) {
  const auto snapshot = tracker_.Current();
  if (snapshot.status == channel::ChannelStatus::kConnected && snapshot.stub) {
    Upload(batch, *snapshot.stub);
  } else {
    telemetry_.RecordAbandoned(batch.size());
  }

  telemetry_.MaybeFlush();
}

void SegmentUplinkConsumer::OnError(const std::vector<segment::SegmentPtr>& batch, const std::exception& error) {
  UPLINK_LOG_ERROR("Unexpected failure sending trace segments to collector",
                   {IntField("count", static_cast<std::int64_t>(batch.size())), StringField("error", error.what())});
}

void SegmentUplinkConsumer::OnExit() {
  reporter_->Detach();
}

void SegmentUplinkConsumer::Upload(std::vector<segment::SegmentPtr>& batch, transport::CollectorStub& stub) {
  auto status   = std::make_shared<transport::StreamStatus>();
  auto reporter = reporter_;

  transport::StreamCallbacks callbacks;
  callbacks.on_completed = [status] { status->Finished(); };
  callbacks.on_error     = [status, reporter](const ::grpc::Status& error) {
    status->Finished();
    UPLINK_LOG_ERROR("Send UpstreamSegment to collector failed with a gRPC error",
                     {IntField("code", static_cast<int>(error.error_code())), StringField("error", error.error_message())});
    reporter->Report(error);
  };

  std::unique_ptr<transport::UpstreamWriter> writer;
  try {
    writer = stub.Collect(std::move(callbacks), std::chrono::system_clock::now() + kStreamDeadlineFactor * completion_timeout_);
  } catch (const std::exception& e) {
    UPLINK_LOG_ERROR("Failed to open collector stream", {StringField("error", e.what()), IntField("count", static_cast<std::int64_t>(batch.size()))});
    telemetry_.RecordAbandoned(batch.size());
    return;
  }

  std::uint64_t attempted = 0;
  for (auto& segment : batch) {
    try {
      if (segment->IsReadyToTransform()) {
        writer->Write(segment->Transform());
        ++attempted;
      } else {
        RedirectToAsyncBuffer(std::move(segment));
      }
    } catch (const std::exception& e) {
      UPLINK_LOG_ERROR("Transform and send UpstreamSegment to collector failed", {StringField("error", e.what())});
    }
  }
  writer->WritesDone();

  if (attempted > 0 && status->WaitForFinish(completion_timeout_)) {
    telemetry_.RecordUplinked(attempted);
  }
}

void SegmentUplinkConsumer::RedirectToAsyncBuffer(segment::SegmentPtr segment) {
  if (!async_buffer_.Produce(std::move(segment))) {
    UPLINK_LOG_DEBUG("One trace segment has been abandoned, async buffer is closed");
  }
}

} // namespace uplink::core
