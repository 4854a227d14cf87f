#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/reset/table_rebuilder.h"
#include "../../src/store/memory_durable_index.h"
#include "../../src/store/table_schema.h"
#include "../store/mock_stores.h"

#include <chrono>

using namespace WaitingRoom;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Return;

namespace {

DurableTableNames TestTables() {
    return DurableTableNames{"TokenTable", "QueuePositionEntryTime", "ServingCounterIssuedAt"};
}

WaiterOptions FastWaiter(std::chrono::milliseconds timeout = 2000ms) {
    WaiterOptions options;
    options.poll_interval = 1ms;
    options.timeout = timeout;
    return options;
}

} // namespace

class TableRebuilderTest : public ::testing::Test {
protected:
    TableRebuilderTest() : index_(TestTables(), 2), rebuilder_(index_, FastWaiter()) {}

    InMemoryDurableIndex index_;
    TableRebuilder rebuilder_;
};

TEST_F(TableRebuilderTest, ReplacesActiveTable) {
    ASSERT_TRUE(index_.PutQueuePositionEntry({"req-1", 1, 100}).ok());

    ASSERT_TRUE(rebuilder_.Rebuild(QueuePositionEntryTableSchema("QueuePositionEntryTime")).ok());

    EXPECT_EQ(*index_.DescribeTable("QueuePositionEntryTime"), TableStatus::ACTIVE);
    EXPECT_TRUE(index_.IsPointInTimeRecoveryEnabled("QueuePositionEntryTime"));
    EXPECT_EQ(index_.RowCount("QueuePositionEntryTime"), 0u);
    auto found = index_.FindQueuePositionEntry(1);
    ASSERT_TRUE(found.ok());
    EXPECT_FALSE(found->has_value());
}

TEST_F(TableRebuilderTest, RecreatesAnAlreadyDeletedTable) {
    index_.SetTransitionPolls(0);
    ASSERT_TRUE(index_.DeleteTable("TokenTable").ok());
    index_.SetTransitionPolls(2);

    ASSERT_TRUE(rebuilder_.Rebuild(TokenTableSchema("TokenTable")).ok());
    EXPECT_EQ(*index_.DescribeTable("TokenTable"), TableStatus::ACTIVE);
    EXPECT_TRUE(index_.IsPointInTimeRecoveryEnabled("TokenTable"));
}

TEST_F(TableRebuilderTest, WaitsOutADeletionInFlight) {
    ASSERT_TRUE(index_.DeleteTable("TokenTable").ok());
    ASSERT_EQ(*index_.DescribeTable("TokenTable"), TableStatus::DELETING);

    ASSERT_TRUE(rebuilder_.Rebuild(TokenTableSchema("TokenTable")).ok());
    EXPECT_EQ(*index_.DescribeTable("TokenTable"), TableStatus::ACTIVE);
}

TEST_F(TableRebuilderTest, SettlesACreationInFlightBeforeDeleting) {
    index_.SetTransitionPolls(0);
    ASSERT_TRUE(index_.DeleteTable("TokenTable").ok());
    index_.SetTransitionPolls(2);
    ASSERT_TRUE(index_.CreateTable(TokenTableSchema("TokenTable")).ok());
    ASSERT_EQ(*index_.DescribeTable("TokenTable"), TableStatus::CREATING);

    ASSERT_TRUE(rebuilder_.Rebuild(TokenTableSchema("TokenTable")).ok());
    EXPECT_EQ(*index_.DescribeTable("TokenTable"), TableStatus::ACTIVE);
    EXPECT_TRUE(index_.IsPointInTimeRecoveryEnabled("TokenTable"));
}

TEST(TableRebuilderWaitTest, TimesOutWhenTheTableNeverSettles) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter(20ms));

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillRepeatedly(Return(absl::StatusOr<TableStatus>(TableStatus::CREATING)));

    auto start = std::chrono::steady_clock::now();
    absl::Status status = rebuilder.WaitForTableStatus("TokenTable", TableStatus::ACTIVE);
    EXPECT_TRUE(absl::IsDeadlineExceeded(status));
    EXPECT_NE(std::string(status.message()).find("TokenTable"), std::string::npos);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST(TableRebuilderWaitTest, OverallDeadlineWinsOverTheWaitTimeout) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter(60000ms));

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillRepeatedly(Return(absl::StatusOr<TableStatus>(TableStatus::DELETING)));

    absl::Status status = rebuilder.WaitForTableStatus("TokenTable", TableStatus::NOT_FOUND,
                                                       std::chrono::steady_clock::now() + 10ms);
    EXPECT_TRUE(absl::IsDeadlineExceeded(status));
}

TEST(TableRebuilderWaitTest, ReturnsAsSoonAsTheTargetIsSeen) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter());

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::DELETING)))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::NOT_FOUND)));

    EXPECT_TRUE(rebuilder.WaitForTableStatus("TokenTable", TableStatus::NOT_FOUND).ok());
}

TEST(TableRebuilderFailureTest, StepFailuresNameTheStep) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter());

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::ACTIVE)));
    EXPECT_CALL(admin, DeleteTable("TokenTable"))
        .WillOnce(Return(absl::PermissionDeniedError("not authorized")));

    absl::Status status = rebuilder.Rebuild(TokenTableSchema("TokenTable"));
    EXPECT_TRUE(absl::IsInternal(status));
    EXPECT_NE(std::string(status.message()).find("delete TokenTable"), std::string::npos);
}

TEST(TableRebuilderFailureTest, BackupFailureFailsTheRebuild) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter());

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::NOT_FOUND)))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::ACTIVE)));
    EXPECT_CALL(admin, CreateTable(_)).WillOnce(Return(absl::OkStatus()));
    EXPECT_CALL(admin, EnablePointInTimeRecovery("TokenTable"))
        .WillOnce(Return(absl::UnavailableError("backup service down")));

    absl::Status status = rebuilder.Rebuild(TokenTableSchema("TokenTable"));
    EXPECT_TRUE(absl::IsInternal(status));
    EXPECT_NE(std::string(status.message()).find("point-in-time recovery"), std::string::npos);
}

TEST(TableRebuilderFailureTest, CreationTimeoutKeepsItsCode) {
    MockTableAdmin admin;
    TableRebuilder rebuilder(admin, FastWaiter(10ms));

    EXPECT_CALL(admin, DescribeTable("TokenTable"))
        .WillOnce(Return(absl::StatusOr<TableStatus>(TableStatus::NOT_FOUND)))
        .WillRepeatedly(Return(absl::StatusOr<TableStatus>(TableStatus::CREATING)));
    EXPECT_CALL(admin, CreateTable(_)).WillOnce(Return(absl::OkStatus()));

    absl::Status status = rebuilder.Rebuild(TokenTableSchema("TokenTable"));
    EXPECT_TRUE(absl::IsDeadlineExceeded(status));
}
