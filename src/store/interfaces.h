#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "records.h"

namespace WaitingRoom {

/**
 * Interface for the fast counter store (atomic operations on named integer counters)
 */
class ICounterStore {
public:
	virtual ~ICounterStore() = default;

	/// Current value, or nullopt when the key was never written
	virtual absl::StatusOr<std::optional<int64_t>> Get(absl::string_view key) = 0;

	/// Unconditional set; returns the previous value (GETSET)
	virtual absl::StatusOr<std::optional<int64_t>> Set(absl::string_view key, int64_t value) = 0;

	/// Atomic add; returns the value after the increment. Absent keys start at 0.
	virtual absl::StatusOr<int64_t> IncrBy(absl::string_view key, int64_t delta) = 0;

	/// Atomic max-set; returns the value held after the call, which is >= value
	virtual absl::StatusOr<int64_t> SetIfGreater(absl::string_view key, int64_t value) = 0;
};

/**
 * Interface for the durable indexed store: queue position entries and the serving counter issuance log
 */
class IDurableIndex {
public:
	virtual ~IDurableIndex() = default;

	/// Issuances of event_id with serving_counter > after, ascending by serving_counter
	virtual absl::StatusOr<std::vector<ServingCounterIssuance>> QueryServingIssuancesAfter(
			absl::string_view event_id, int64_t after) = 0;

	/// Point lookup through QueuePositionIndex
	virtual absl::StatusOr<std::optional<QueuePositionEntry>> FindQueuePositionEntry(int64_t queue_position) = 0;

	/// Insert-if-absent on (event_id, serving_counter); an existing key yields kAlreadyExists
	virtual absl::Status PutServingIssuance(const ServingCounterIssuance& issuance) = 0;

	/// Insert-if-absent on request_id and on queue_position; either collision yields kAlreadyExists
	virtual absl::Status PutQueuePositionEntry(const QueuePositionEntry& entry) = 0;

	/// Point lookup by the table's primary key
	virtual absl::StatusOr<std::optional<QueuePositionEntry>> FindQueuePositionEntryByRequest(
			const std::string& request_id) = 0;
};

/**
 * Interface for table lifecycle operations used by the reset controller
 */
class ITableAdmin {
public:
	virtual ~ITableAdmin() = default;

	virtual absl::Status DeleteTable(const std::string& table_name) = 0;
	virtual absl::Status CreateTable(const TableSchema& schema) = 0;
	virtual absl::StatusOr<TableStatus> DescribeTable(const std::string& table_name) = 0;
	virtual absl::Status EnablePointInTimeRecovery(const std::string& table_name) = 0;
};

} // namespace WaitingRoom
