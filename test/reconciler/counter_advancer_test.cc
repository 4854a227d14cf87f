#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../common/fake_clock.h"
#include "../../src/reconciler/counter_advancer.h"
#include "../../src/store/memory_counter_store.h"
#include "../../src/store/memory_durable_index.h"
#include "../events/mock_publishers.h"
#include "../store/mock_stores.h"

using namespace WaitingRoom;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

constexpr char kEventId[] = "Sample";

AdvancerOptions TestOptions() {
    return AdvancerOptions{kEventId, {"custom.waitingroom", "automatic_serving_counter_incr", "default"}};
}

DurableTableNames TestTables() {
    return DurableTableNames{"TokenTable", "QueuePositionEntryTime", "ServingCounterIssuedAt"};
}

} // namespace

TEST(CounterAdvancerMathTest, IncrementIsGapMinusServed) {
    EXPECT_EQ(CounterAdvancer::ComputeIncrement(2, 5, 0), 3);
    EXPECT_EQ(CounterAdvancer::ComputeIncrement(0, 20, 10), 10);
    EXPECT_EQ(CounterAdvancer::ComputeIncrement(10, 20, 10), 0);
    EXPECT_EQ(CounterAdvancer::ComputeIncrement(12, 20, 10), -2);
}

class CounterAdvancerTest : public ::testing::Test {
protected:
    CounterAdvancerTest()
        : clock_(1700000000),
          counters_(counter_store_),
          index_(TestTables()) {}

    FakeClock clock_;
    InMemoryCounterStore counter_store_;
    CounterStoreAdapter counters_;
    InMemoryDurableIndex index_;
    RecordingEventPublisher publisher_;
};

TEST_F(CounterAdvancerTest, AppliesIncrementRecordsAndNotifies) {
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 10).ok());
    CounterAdvancer advancer(counters_, index_, publisher_, clock_, TestOptions());

    auto applied = advancer.AdvanceServingCounter(2, 15, 10);
    ASSERT_TRUE(applied.ok());
    EXPECT_EQ(*applied, 3);
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 13);

    auto issuances = index_.QueryServingIssuancesAfter(kEventId, 0);
    ASSERT_TRUE(issuances.ok());
    ASSERT_EQ(issuances->size(), 1u);
    EXPECT_EQ((*issuances)[0].event_id, kEventId);
    EXPECT_EQ((*issuances)[0].serving_counter, 13);
    EXPECT_EQ((*issuances)[0].issue_time, 1700000000);
    EXPECT_EQ((*issuances)[0].queue_positions_served, 0);

    ASSERT_EQ(publisher_.events.size(), 1u);
    const EventEnvelope& event = publisher_.events[0];
    EXPECT_EQ(event.source(), "custom.waitingroom");
    EXPECT_EQ(event.detail_type(), "automatic_serving_counter_incr");
    EXPECT_EQ(event.time(), 1700000000);
    EXPECT_EQ(event.increment().previous_serving_counter_position(), 10);
    EXPECT_EQ(event.increment().increment_by(), 3);
    EXPECT_EQ(event.increment().current_serving_counter_position(), 13);
}

TEST_F(CounterAdvancerTest, NotificationReflectsConcurrentIncrements) {
    // Another writer moved the counter past the previous serving position
    ASSERT_TRUE(counters_.Write(CounterKey::SERVING_COUNTER, 40).ok());
    CounterAdvancer advancer(counters_, index_, publisher_, clock_, TestOptions());

    ASSERT_EQ(*advancer.AdvanceServingCounter(0, 20, 15), 5);
    ASSERT_EQ(publisher_.events.size(), 1u);
    EXPECT_EQ(publisher_.events[0].increment().previous_serving_counter_position(), 40);
    EXPECT_EQ(publisher_.events[0].increment().current_serving_counter_position(), 45);
}

TEST_F(CounterAdvancerTest, PublishFailureDoesNotUndoTheIncrement) {
    StrictMock<MockEventPublisher> publisher;
    CounterAdvancer advancer(counters_, index_, publisher, clock_, TestOptions());

    EXPECT_CALL(publisher, Publish(_)).WillOnce(Return(absl::UnavailableError("bus unreachable")));

    auto applied = advancer.AdvanceServingCounter(0, 4, 0);
    ASSERT_TRUE(applied.ok());
    EXPECT_EQ(*applied, 4);
    EXPECT_EQ(*counters_.Read(CounterKey::SERVING_COUNTER), 4);
    EXPECT_EQ(index_.RowCount("ServingCounterIssuedAt"), 1u);
}

TEST_F(CounterAdvancerTest, DuplicateIssuanceIsReportedWithoutNotification) {
    ASSERT_TRUE(index_.PutServingIssuance({kEventId, 4, 100, 0}).ok());
    CounterAdvancer advancer(counters_, index_, publisher_, clock_, TestOptions());

    auto applied = advancer.AdvanceServingCounter(0, 4, 0);
    EXPECT_TRUE(absl::IsAlreadyExists(applied.status()));
    EXPECT_TRUE(publisher_.events.empty());
}

TEST(CounterAdvancerGuardTest, NonPositiveIncrementTouchesNothing) {
    StrictMock<MockCounterStore> counter_store;
    StrictMock<MockDurableIndex> index;
    StrictMock<MockEventPublisher> publisher;
    FakeClock clock(1000);
    CounterStoreAdapter counters(counter_store);
    CounterAdvancer advancer(counters, index, publisher, clock, TestOptions());

    auto zero = advancer.AdvanceServingCounter(10, 20, 10);
    ASSERT_TRUE(zero.ok());
    EXPECT_EQ(*zero, 0);

    auto negative = advancer.AdvanceServingCounter(8, 5, 0);
    ASSERT_TRUE(negative.ok());
    EXPECT_EQ(*negative, 0);
}

TEST(CounterAdvancerGuardTest, IncrementFailureStopsBeforeTheLog) {
    StrictMock<MockCounterStore> counter_store;
    StrictMock<MockDurableIndex> index;
    StrictMock<MockEventPublisher> publisher;
    FakeClock clock(1000);
    CounterStoreAdapter counters(counter_store);
    CounterAdvancer advancer(counters, index, publisher, clock, TestOptions());

    EXPECT_CALL(counter_store, IncrBy(absl::string_view("serving_counter"), 3))
        .WillOnce(Return(absl::UnavailableError("timeout")));

    auto applied = advancer.AdvanceServingCounter(2, 5, 0);
    EXPECT_TRUE(absl::IsUnavailable(applied.status()));
}
