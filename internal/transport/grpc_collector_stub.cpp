#include "collector_stub.hpp"

#include <deque>
#include <mutex>

#include <grpcpp/client_context.h>
#include <grpcpp/support/client_callback.h>

#include "uplink/v1.hpp"

namespace uplink::transport {

namespace {

using uplink::v1::Downstream;
using uplink::v1::TraceSegmentReportService;
using uplink::v1::UpstreamSegment;

/*
  Callback-API client stream for one batch.

  Writes are issued one at a time; the queue is refilled from OnWriteDone.
  A hold keeps OnDone from running while the owning writer may still start
  operations from outside a reaction; it is released by WritesDone().
  The reactor owns itself until OnDone, so the caller may stop waiting at
  any point without leaving gRPC with a dangling reactor. The context
  deadline bounds how long that can take.
*/
class CollectReactor final : public ::grpc::ClientWriteReactor<UpstreamSegment>,
                             public std::enable_shared_from_this<CollectReactor> {
 public:
  explicit CollectReactor(StreamCallbacks callbacks) : callbacks_(std::move(callbacks)) {
  }

  void Start(TraceSegmentReportService::Stub* stub, std::chrono::system_clock::time_point deadline) {
    self_ = shared_from_this();
    context_.set_deadline(deadline);
    stub->async()->Collect(&context_, &response_, this);
    AddHold();
    StartCall();
  }

  void Write(UpstreamSegment segment) {
    {
      std::lock_guard lock(mutex_);
      if (failed_ || closing_) return;

      pending_.push_back(std::move(segment));
      if (writing_) return;

      writing_ = true;
      current_ = std::move(pending_.front());
      pending_.pop_front();
    }
    StartWrite(&current_);
  }

  void WritesDone() {
    bool finish_writes = false;
    {
      std::lock_guard lock(mutex_);
      if (closing_) return;
      closing_ = true;
      if (!writing_ && !failed_) {
        writes_done_started_ = true;
        finish_writes        = true;
      }
    }
    if (finish_writes) StartWritesDone();
    RemoveHold();
  }

  void OnWriteDone(bool ok) override {
    bool write_next    = false;
    bool finish_writes = false;
    {
      std::lock_guard lock(mutex_);
      if (!ok) {
        // the stream is broken; OnDone carries the status
        failed_  = true;
        writing_ = false;
        pending_.clear();
        return;
      }

      if (!pending_.empty()) {
        current_ = std::move(pending_.front());
        pending_.pop_front();
        write_next = true;
      } else {
        writing_ = false;
        if (closing_ && !writes_done_started_) {
          writes_done_started_ = true;
          finish_writes        = true;
        }
      }
    }

    if (write_next) {
      StartWrite(&current_);
    } else if (finish_writes) {
      StartWritesDone();
    }
  }

  void OnDone(const ::grpc::Status& status) override {
    auto keep_alive = std::move(self_);

    if (status.ok()) {
      if (callbacks_.on_completed) callbacks_.on_completed();
    } else {
      if (callbacks_.on_error) callbacks_.on_error(status);
    }
  }

 private:
  StreamCallbacks       callbacks_;
  ::grpc::ClientContext context_;
  Downstream            response_;

  std::mutex                  mutex_;
  std::deque<UpstreamSegment> pending_;
  UpstreamSegment             current_;
  bool                        writing_             = false;
  bool                        closing_             = false;
  bool                        writes_done_started_ = false;
  bool                        failed_              = false;

  std::shared_ptr<CollectReactor> self_;
};

class ReactorWriter final : public UpstreamWriter {
 public:
  explicit ReactorWriter(std::shared_ptr<CollectReactor> reactor) : reactor_(std::move(reactor)) {
  }

  ~ReactorWriter() override {
    WritesDone();
  }

  void Write(UpstreamSegment segment) override {
    if (!done_) reactor_->Write(std::move(segment));
  }

  void WritesDone() override {
    if (done_) return;
    done_ = true;
    reactor_->WritesDone();
  }

 private:
  std::shared_ptr<CollectReactor> reactor_;
  bool                            done_ = false;
};

class GrpcCollectorStub final : public CollectorStub {
 public:
  explicit GrpcCollectorStub(std::shared_ptr<::grpc::Channel> channel) : stub_(TraceSegmentReportService::NewStub(std::move(channel))) {
  }

  std::unique_ptr<UpstreamWriter> Collect(StreamCallbacks callbacks, std::chrono::system_clock::time_point deadline) override {
    auto reactor = std::make_shared<CollectReactor>(std::move(callbacks));
    reactor->Start(stub_.get(), deadline);
    return std::make_unique<ReactorWriter>(std::move(reactor));
  }

 private:
  std::unique_ptr<TraceSegmentReportService::Stub> stub_;
};

} // namespace

std::shared_ptr<CollectorStub> NewGrpcCollectorStub(std::shared_ptr<::grpc::Channel> channel) {
  return std::make_shared<GrpcCollectorStub>(std::move(channel));
}

} // namespace uplink::transport
