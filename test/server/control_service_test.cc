#include <gtest/gtest.h>
#include "../common/fake_clock.h"
#include "../../src/server/control_service.h"
#include "../../src/store/memory_counter_store.h"
#include "../../src/store/memory_durable_index.h"

#include <chrono>
#include <memory>
#include <thread>

#include <grpcpp/grpcpp.h>

using namespace WaitingRoom;
using namespace std::chrono_literals;

namespace {

constexpr char kEventId[] = "Sample";

DurableTableNames TestTables() {
    return DurableTableNames{"TokenTable", "QueuePositionEntryTime", "ServingCounterIssuedAt"};
}

ResetOptions TestResetOptions() {
    ResetOptions options;
    options.event_id = kEventId;
    options.tables = TestTables();
    options.waiter.poll_interval = 1ms;
    options.waiter.timeout = 2000ms;
    options.overall_timeout = 10000ms;
    return options;
}

} // namespace

/**
 * Full daemon wiring over an in-process channel
 */
class ControlServiceTest : public ::testing::Test {
protected:
    ControlServiceTest()
        : clock_(1000),
          counters_(counter_store_),
          index_(TestTables()),
          advancer_(counters_, index_, event_bus_, clock_,
                    AdvancerOptions{kEventId, {"custom.waitingroom", "automatic_serving_counter_incr", "default"}}),
          scanner_(counters_, index_, advancer_, clock_, gate_, ScannerOptions{kEventId, 60, true}),
          reset_controller_(counters_, index_, gate_, TestResetOptions()),
          recorder_(counters_, index_, clock_, gate_, kEventId),
          service_(scanner_, reset_controller_, recorder_, counters_, event_bus_) {}

    void SetUp() override {
        grpc::ServerBuilder builder;
        builder.RegisterService(&service_);
        server_ = builder.BuildAndStart();
        ASSERT_NE(server_, nullptr);
        stub_ = WaitingRoomControl::NewStub(server_->InProcessChannel(grpc::ChannelArguments()));
    }

    void TearDown() override {
        server_->Shutdown(std::chrono::system_clock::now() + 1s);
        event_bus_.Stop();
    }

    FakeClock clock_;
    InMemoryCounterStore counter_store_;
    CounterStoreAdapter counters_;
    InMemoryDurableIndex index_;
    EventBus event_bus_;
    CounterAdvancer advancer_;
    WriteGate gate_;
    ExpiryScanner scanner_;
    ResetController reset_controller_;
    AdmissionRecorder recorder_;
    WaitingRoomControlServiceImpl service_;

    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<WaitingRoomControl::Stub> stub_;
};

TEST_F(ControlServiceTest, ReconcileReportsThePass) {
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 5).ok());
    ASSERT_TRUE(index_.PutServingIssuance({kEventId, 5, 900, 2}).ok());
    ASSERT_TRUE(index_.PutQueuePositionEntry({"req-5", 5, 880}).ok());

    grpc::ClientContext context;
    ReconcileRequest request;
    ReconcileResponse reply;
    grpc::Status status = stub_->Reconcile(&context, request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();

    EXPECT_EQ(reply.outcome(), ReconcileResponse::CANDIDATES_EXHAUSTED);
    EXPECT_EQ(reply.watermark_before(), 0);
    EXPECT_EQ(reply.watermark_after(), 5);
    EXPECT_EQ(reply.positions_expired(), 1);
    EXPECT_EQ(reply.serving_counter_increments(), 1);
}

TEST_F(ControlServiceTest, ReconcileWhileFrozen) {
    ASSERT_TRUE(counters_.SetResetInProgress(true).ok());

    grpc::ClientContext context;
    ReconcileRequest request;
    ReconcileResponse reply;
    ASSERT_TRUE(stub_->Reconcile(&context, request, &reply).ok());
    EXPECT_EQ(reply.outcome(), ReconcileResponse::RESET_IN_PROGRESS);
}

TEST_F(ControlServiceTest, GetCountersSnapshot) {
    ASSERT_TRUE(counters_.Write(CounterKey::QUEUE_COUNTER, 25).ok());
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 10).ok());

    grpc::ClientContext context;
    GetCountersRequest request;
    GetCountersResponse reply;
    ASSERT_TRUE(stub_->GetCounters(&context, request, &reply).ok());

    EXPECT_EQ(reply.counters_size(), 7);
    EXPECT_EQ(reply.counters().at("queue_counter"), 25);
    EXPECT_EQ(reply.counters().at("serving_counter"), 10);
    EXPECT_EQ(reply.counters().at("reset_in_progress"), 0);
    EXPECT_EQ(reply.controller_state(), "IDLE");
}

TEST_F(ControlServiceTest, ResetWithWrongEventId) {
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 10).ok());

    grpc::ClientContext context;
    ResetRequest request;
    request.set_event_id("Other");
    ResetResponse reply;
    ASSERT_TRUE(stub_->Reset(&context, request, &reply).ok());

    EXPECT_EQ(reply.status_code(), 400);
    EXPECT_EQ(reply.error(), "Invalid event ID");
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 10);
}

TEST_F(ControlServiceTest, ResetCompletes) {
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 10).ok());

    grpc::ClientContext context;
    ResetRequest request;
    request.set_event_id(kEventId);
    ResetResponse reply;
    grpc::Status status = stub_->Reset(&context, request, &reply);
    ASSERT_TRUE(status.ok()) << status.error_message();

    EXPECT_EQ(reply.status_code(), 200);
    EXPECT_EQ(reply.message(), "Reset completed");
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 0);
}

TEST_F(ControlServiceTest, SubscribersReceiveServingCounterIncrements) {
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 5).ok());
    ASSERT_TRUE(index_.PutServingIssuance({kEventId, 5, 900, 2}).ok());
    ASSERT_TRUE(index_.PutQueuePositionEntry({"req-5", 5, 880}).ok());

    grpc::ClientContext stream_context;
    SubscribeEventsRequest subscribe;
    auto reader = stub_->SubscribeEvents(&stream_context, subscribe);

    // The stream is live once the bus has a subscriber
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (event_bus_.NumSubscribers() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(event_bus_.NumSubscribers(), 1u);

    grpc::ClientContext context;
    ReconcileRequest request;
    ReconcileResponse reply;
    ASSERT_TRUE(stub_->Reconcile(&context, request, &reply).ok());

    EventEnvelope event;
    ASSERT_TRUE(reader->Read(&event));
    EXPECT_EQ(event.source(), "custom.waitingroom");
    EXPECT_EQ(event.detail_type(), "automatic_serving_counter_incr");
    EXPECT_EQ(event.increment().previous_serving_counter_position(), 5);
    EXPECT_EQ(event.increment().increment_by(), 3);
    EXPECT_EQ(event.increment().current_serving_counter_position(), 8);

    stream_context.TryCancel();
    reader->Finish();
}

TEST_F(ControlServiceTest, RecordedPositionsExpireThroughReconcile) {
    grpc::ClientContext assign_context;
    AssignQueuePositionRequest assign;
    assign.set_request_id("req-a");
    AssignQueuePositionResponse position;
    grpc::Status status = stub_->AssignQueuePosition(&assign_context, assign, &position);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(position.queue_position(), 1);
    EXPECT_EQ(position.entry_time(), 1000);

    grpc::ClientContext serve_context;
    IncrementServingCounterRequest serve;
    serve.set_increment_by(1);
    serve.set_queue_positions_served(0);
    IncrementServingCounterResponse served;
    status = stub_->IncrementServingCounter(&serve_context, serve, &served);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(served.serving_counter(), 1);
    EXPECT_EQ(served.issue_time(), 1000);

    clock_.Advance(61);

    grpc::ClientContext context;
    ReconcileRequest request;
    ReconcileResponse reply;
    ASSERT_TRUE(stub_->Reconcile(&context, request, &reply).ok());
    EXPECT_EQ(reply.outcome(), ReconcileResponse::CANDIDATES_EXHAUSTED);
    EXPECT_EQ(reply.positions_expired(), 1);
    EXPECT_EQ(reply.watermark_after(), 1);
    // The unserved position is credited back to the serving counter
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 2);
}

TEST_F(ControlServiceTest, RecordingIsRefusedWhileFrozen) {
    ASSERT_TRUE(counters_.SetResetInProgress(true).ok());

    grpc::ClientContext assign_context;
    AssignQueuePositionRequest assign;
    assign.set_request_id("req-a");
    AssignQueuePositionResponse position;
    EXPECT_EQ(stub_->AssignQueuePosition(&assign_context, assign, &position).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);

    grpc::ClientContext serve_context;
    IncrementServingCounterRequest serve;
    serve.set_increment_by(1);
    IncrementServingCounterResponse served;
    EXPECT_EQ(stub_->IncrementServingCounter(&serve_context, serve, &served).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(*counters_.Read(CounterKey::QUEUE_COUNTER), 0);
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 0);
}

TEST_F(ControlServiceTest, EmptyRequestIdIsInvalid) {
    grpc::ClientContext context;
    AssignQueuePositionRequest assign;
    AssignQueuePositionResponse position;
    EXPECT_EQ(stub_->AssignQueuePosition(&context, assign, &position).error_code(),
              grpc::StatusCode::INVALID_ARGUMENT);
}
