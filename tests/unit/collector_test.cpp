#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/collector/segment_sink.hpp"
#include "internal/grpc/collector_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "uplink/v1/segment.grpc.pb.h"

namespace {

using uplink::collector::SegmentSink;
using uplink::v1::UpstreamSegment;

UpstreamSegment Encode(const std::string& segment_id, int spans) {
  uplink::v1::SegmentObject object;
  object.set_trace_segment_id(segment_id);
  object.set_service("checkout");
  for (int i = 0; i < spans; ++i) {
    object.add_spans()->set_span_id(i);
  }

  UpstreamSegment upstream;
  upstream.set_trace_id("trace-" + segment_id);
  object.SerializeToString(upstream.mutable_segment());
  return upstream;
}

void TestSinkCountsSegmentsAndSpans() {
  SegmentSink sink;
  const auto  object = sink.Accept(Encode("a", 2));
  assert(object.trace_segment_id() == "a");
  sink.Accept(Encode("b", 3));
  sink.StreamFinished();

  const auto totals = sink.Snapshot();
  assert(totals.segments == 2);
  assert(totals.spans == 5);
  assert(totals.streams == 1);
}

void TestSinkRejectsUndecodableBody() {
  SegmentSink     sink;
  UpstreamSegment garbage;
  garbage.set_trace_id("trace-x");
  garbage.set_segment(std::string("\xff\xff\xff\xff", 4));

  bool threw = false;
  try {
    sink.Accept(garbage);
  } catch (const uplink::util::InvalidSegment&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    sink.Accept(Encode("", 1));
  } catch (const uplink::util::InvalidSegment&) {
    threw = true;
  }
  assert(threw);
  assert(sink.Snapshot().segments == 0);
}

void TestSinkKeepsOnlyMostRecentIds() {
  SegmentSink sink(2);
  sink.Accept(Encode("one", 1));
  sink.Accept(Encode("two", 1));
  sink.Accept(Encode("three", 1));

  const auto recent = sink.RecentSegmentIds();
  assert(recent.size() == 2);
  assert(recent[0] == "two" && recent[1] == "three");
}

void TestErrorsMapToGrpcStatus() {
  using uplink::grpc::ToStatus;

  assert(ToStatus(uplink::util::InvalidSegment("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(uplink::util::TransformError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(uplink::util::InvalidConfig("bad")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestCollectStreamsIntoSinkAndRejectsGarbage() {
  auto sink = std::make_shared<SegmentSink>();

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<uplink::grpc::CollectorServer>(sink));
  uplink::runtime::Server server("127.0.0.1:0", std::move(services));
  const int               port = server.Start();

  auto channel = ::grpc::CreateChannel("127.0.0.1:" + std::to_string(port), ::grpc::InsecureChannelCredentials());
  auto stub    = uplink::v1::TraceSegmentReportService::NewStub(channel);

  {
    ::grpc::ClientContext    context;
    uplink::v1::Downstream   response;
    auto                     writer = stub->Collect(&context, &response);
    assert(writer->Write(Encode("s1", 1)));
    assert(writer->Write(Encode("s2", 2)));
    writer->WritesDone();
    assert(writer->Finish().ok());
  }

  assert(sink->Snapshot().segments == 2);
  assert(sink->Snapshot().streams == 1);

  {
    ::grpc::ClientContext  context;
    uplink::v1::Downstream response;
    auto                   writer = stub->Collect(&context, &response);
    writer->Write(Encode("", 1));
    writer->WritesDone();
    assert(writer->Finish().error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }

  assert(sink->Snapshot().segments == 2);
  server.Stop();
}

} // namespace

int main() {
  TestSinkCountsSegmentsAndSpans();
  TestSinkRejectsUndecodableBody();
  TestSinkKeepsOnlyMostRecentIds();
  TestErrorsMapToGrpcStatus();
  TestCollectStreamsIntoSinkAndRejectsGarbage();

  std::cout << "segment_uplink_unit_collector: pass\n";
  return 0;
}
