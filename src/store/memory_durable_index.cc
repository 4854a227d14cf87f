#include "memory_durable_index.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"
#include "table_schema.h"

namespace WaitingRoom {

InMemoryDurableIndex::InMemoryDurableIndex(DurableTableNames names, int transition_polls)
	: names_(std::move(names)), transition_polls_(transition_polls) {
	// Tables exist from deployment onwards; only a reset replaces them
	absl::MutexLock lock(&mutex_);
	for (const TableSchema& schema : {TokenTableSchema(names_.token_table),
			QueuePositionEntryTableSchema(names_.queue_position_entry_table),
			ServingCounterIssuanceTableSchema(names_.serving_counter_issuance_table)}) {
		tables_[schema.table_name] = Table{schema, TableStatus::ACTIVE, 0, true};
	}
}

absl::Status InMemoryDurableIndex::CheckActive(const std::string& table_name,
		absl::string_view operation) const {
	auto it = tables_.find(table_name);
	if (it == tables_.end()) {
		return StoreFailure(operation, absl::StrCat("table ", table_name, " does not exist"));
	}
	if (it->second.status != TableStatus::ACTIVE) {
		return StoreFailure(operation, absl::StrCat("table ", table_name, " is ",
					TableStatusName(it->second.status)));
	}
	return absl::OkStatus();
}

absl::StatusOr<std::vector<ServingCounterIssuance>> InMemoryDurableIndex::QueryServingIssuancesAfter(
		absl::string_view event_id, int64_t after) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.serving_counter_issuance_table, "query serving counter issuances");
	if (!active.ok()) {
		return active;
	}

	std::vector<ServingCounterIssuance> result;
	auto partition = issuances_.find(event_id);
	if (partition == issuances_.end()) {
		return result;
	}
	for (auto it = partition->second.upper_bound(after); it != partition->second.end(); ++it) {
		result.push_back(it->second);
	}
	return result;
}

absl::StatusOr<std::optional<QueuePositionEntry>> InMemoryDurableIndex::FindQueuePositionEntry(
		int64_t queue_position) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.queue_position_entry_table, "query queue position index");
	if (!active.ok()) {
		return active;
	}

	auto index_it = queue_position_index_.find(queue_position);
	if (index_it == queue_position_index_.end()) {
		return std::optional<QueuePositionEntry>();
	}
	return std::optional<QueuePositionEntry>(queue_entries_.at(index_it->second));
}

absl::Status InMemoryDurableIndex::PutServingIssuance(const ServingCounterIssuance& issuance) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.serving_counter_issuance_table, "put serving counter issuance");
	if (!active.ok()) {
		return active;
	}

	auto& partition = issuances_[issuance.event_id];
	if (!partition.try_emplace(issuance.serving_counter, issuance).second) {
		return DuplicateIssuance(absl::StrCat(issuance.event_id, "/", issuance.serving_counter));
	}
	return absl::OkStatus();
}

absl::Status InMemoryDurableIndex::PutQueuePositionEntry(const QueuePositionEntry& entry) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.queue_position_entry_table, "put queue position entry");
	if (!active.ok()) {
		return active;
	}

	if (queue_entries_.contains(entry.request_id)) {
		return absl::AlreadyExistsError(absl::StrCat("request ", entry.request_id, " already has a queue position"));
	}
	if (!queue_position_index_.try_emplace(entry.queue_position, entry.request_id).second) {
		return absl::AlreadyExistsError(absl::StrCat("queue position ", entry.queue_position, " already issued"));
	}
	queue_entries_.emplace(entry.request_id, entry);
	return absl::OkStatus();
}

absl::StatusOr<std::optional<QueuePositionEntry>> InMemoryDurableIndex::FindQueuePositionEntryByRequest(
		const std::string& request_id) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.queue_position_entry_table, "get queue position entry");
	if (!active.ok()) {
		return active;
	}

	auto it = queue_entries_.find(request_id);
	if (it == queue_entries_.end()) {
		return std::optional<QueuePositionEntry>();
	}
	return std::optional<QueuePositionEntry>(it->second);
}

absl::Status InMemoryDurableIndex::PutToken(const std::string& request_id,
		const std::string& event_id, int64_t expires) {
	absl::MutexLock lock(&mutex_);
	absl::Status active = CheckActive(names_.token_table, "put token");
	if (!active.ok()) {
		return active;
	}
	tokens_[request_id] = TokenRecord{event_id, expires};
	return absl::OkStatus();
}

void InMemoryDurableIndex::DropRows(const std::string& table_name) {
	if (table_name == names_.token_table) {
		tokens_.clear();
	} else if (table_name == names_.queue_position_entry_table) {
		queue_entries_.clear();
		queue_position_index_.clear();
	} else if (table_name == names_.serving_counter_issuance_table) {
		issuances_.clear();
	}
}

absl::Status InMemoryDurableIndex::DeleteTable(const std::string& table_name) {
	absl::MutexLock lock(&mutex_);
	auto it = tables_.find(table_name);
	if (it == tables_.end()) {
		return absl::NotFoundError(absl::StrCat("table ", table_name, " does not exist"));
	}
	if (it->second.status != TableStatus::ACTIVE) {
		return absl::FailedPreconditionError(absl::StrCat("table ", table_name, " is ",
					TableStatusName(it->second.status)));
	}

	DropRows(table_name);
	if (transition_polls_ == 0) {
		tables_.erase(it);
	} else {
		it->second.status = TableStatus::DELETING;
		it->second.pending_polls = transition_polls_;
	}
	VLOG(1) << "Deleting table " << table_name;
	return absl::OkStatus();
}

absl::Status InMemoryDurableIndex::CreateTable(const TableSchema& schema) {
	absl::Status valid = ValidateSchema(schema);
	if (!valid.ok()) {
		return valid;
	}

	absl::MutexLock lock(&mutex_);
	if (tables_.contains(schema.table_name)) {
		return absl::AlreadyExistsError(absl::StrCat("table ", schema.table_name, " already exists"));
	}
	// Recreated tables start without continuous backups
	Table table{schema, TableStatus::ACTIVE, 0, false};
	if (transition_polls_ > 0) {
		table.status = TableStatus::CREATING;
		table.pending_polls = transition_polls_;
	}
	DropRows(schema.table_name);
	tables_.emplace(schema.table_name, std::move(table));
	VLOG(1) << "Creating table " << schema.table_name;
	return absl::OkStatus();
}

absl::StatusOr<TableStatus> InMemoryDurableIndex::DescribeTable(const std::string& table_name) {
	absl::MutexLock lock(&mutex_);
	auto it = tables_.find(table_name);
	if (it == tables_.end()) {
		return TableStatus::NOT_FOUND;
	}

	Table& table = it->second;
	if (table.status == TableStatus::CREATING || table.status == TableStatus::DELETING) {
		if (table.pending_polls > 0) {
			--table.pending_polls;
			return table.status;
		}
		if (table.status == TableStatus::DELETING) {
			tables_.erase(it);
			return TableStatus::NOT_FOUND;
		}
		table.status = TableStatus::ACTIVE;
	}
	return table.status;
}

absl::Status InMemoryDurableIndex::EnablePointInTimeRecovery(const std::string& table_name) {
	absl::MutexLock lock(&mutex_);
	auto it = tables_.find(table_name);
	if (it == tables_.end()) {
		return absl::NotFoundError(absl::StrCat("table ", table_name, " does not exist"));
	}
	if (it->second.status != TableStatus::ACTIVE) {
		return absl::FailedPreconditionError(absl::StrCat("table ", table_name, " is ",
					TableStatusName(it->second.status)));
	}
	it->second.pitr_enabled = true;
	return absl::OkStatus();
}

std::optional<TableSchema> InMemoryDurableIndex::GetSchema(const std::string& table_name) const {
	absl::MutexLock lock(&mutex_);
	auto it = tables_.find(table_name);
	if (it == tables_.end()) {
		return std::nullopt;
	}
	return it->second.schema;
}

bool InMemoryDurableIndex::IsPointInTimeRecoveryEnabled(const std::string& table_name) const {
	absl::MutexLock lock(&mutex_);
	auto it = tables_.find(table_name);
	return it != tables_.end() && it->second.pitr_enabled;
}

size_t InMemoryDurableIndex::RowCount(const std::string& table_name) const {
	absl::MutexLock lock(&mutex_);
	if (table_name == names_.token_table) {
		return tokens_.size();
	}
	if (table_name == names_.queue_position_entry_table) {
		return queue_entries_.size();
	}
	if (table_name == names_.serving_counter_issuance_table) {
		size_t rows = 0;
		for (const auto& partition : issuances_) {
			rows += partition.second.size();
		}
		return rows;
	}
	return 0;
}

void InMemoryDurableIndex::SetTransitionPolls(int polls) {
	absl::MutexLock lock(&mutex_);
	transition_polls_ = polls;
}

} // namespace WaitingRoom
