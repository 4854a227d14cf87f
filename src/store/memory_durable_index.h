#ifndef WAITINGROOM_STORE_MEMORY_DURABLE_INDEX_H_
#define WAITINGROOM_STORE_MEMORY_DURABLE_INDEX_H_

#include <optional>
#include <string>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "interfaces.h"

namespace WaitingRoom {

/**
 * Process-local durable index holding the token, queue position entry and
 * serving counter issuance tables.
 *
 * Table lifecycle mirrors a managed table service: CreateTable and DeleteTable
 * start a transition that settles after transition_polls DescribeTable calls,
 * so waiters see CREATING/DELETING before ACTIVE/NOT_FOUND. With 0 polls the
 * transitions are immediate. Reads and writes require the table to be ACTIVE.
 */
class InMemoryDurableIndex : public IDurableIndex, public ITableAdmin {
	public:
		explicit InMemoryDurableIndex(DurableTableNames names, int transition_polls = 0);

		InMemoryDurableIndex(const InMemoryDurableIndex&) = delete;
		InMemoryDurableIndex& operator=(const InMemoryDurableIndex&) = delete;

		// IDurableIndex
		absl::StatusOr<std::vector<ServingCounterIssuance>> QueryServingIssuancesAfter(
				absl::string_view event_id, int64_t after) override;
		absl::StatusOr<std::optional<QueuePositionEntry>> FindQueuePositionEntry(int64_t queue_position) override;
		absl::Status PutServingIssuance(const ServingCounterIssuance& issuance) override;
		absl::Status PutQueuePositionEntry(const QueuePositionEntry& entry) override;
		absl::StatusOr<std::optional<QueuePositionEntry>> FindQueuePositionEntryByRequest(
				const std::string& request_id) override;

		// ITableAdmin
		absl::Status DeleteTable(const std::string& table_name) override;
		absl::Status CreateTable(const TableSchema& schema) override;
		absl::StatusOr<TableStatus> DescribeTable(const std::string& table_name) override;
		absl::Status EnablePointInTimeRecovery(const std::string& table_name) override;

		/// Written by the token issuance path
		absl::Status PutToken(const std::string& request_id, const std::string& event_id, int64_t expires);

		std::optional<TableSchema> GetSchema(const std::string& table_name) const;
		bool IsPointInTimeRecoveryEnabled(const std::string& table_name) const;
		size_t RowCount(const std::string& table_name) const;

		void SetTransitionPolls(int polls);

	private:
		struct Table {
			TableSchema schema;
			TableStatus status;
			int pending_polls;
			bool pitr_enabled;
		};

		struct TokenRecord {
			std::string event_id;
			int64_t expires;
		};

		absl::Status CheckActive(const std::string& table_name, absl::string_view operation) const
			ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
		void DropRows(const std::string& table_name) ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

		const DurableTableNames names_;

		mutable absl::Mutex mutex_;
		int transition_polls_ ABSL_GUARDED_BY(mutex_);
		absl::flat_hash_map<std::string, Table> tables_ ABSL_GUARDED_BY(mutex_);

		/// Queue position table keyed by request_id, plus QueuePositionIndex (position -> request_id)
		absl::flat_hash_map<std::string, QueuePositionEntry> queue_entries_ ABSL_GUARDED_BY(mutex_);
		absl::btree_map<int64_t, std::string> queue_position_index_ ABSL_GUARDED_BY(mutex_);

		/// Issuance log partitioned by event_id, ordered by serving_counter
		absl::flat_hash_map<std::string, absl::btree_map<int64_t, ServingCounterIssuance>> issuances_ ABSL_GUARDED_BY(mutex_);

		absl::flat_hash_map<std::string, TokenRecord> tokens_ ABSL_GUARDED_BY(mutex_);
};

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_MEMORY_DURABLE_INDEX_H_
