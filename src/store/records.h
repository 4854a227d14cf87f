#ifndef WAITINGROOM_STORE_RECORDS_H_
#define WAITINGROOM_STORE_RECORDS_H_

#include <cstdint>
#include <string>
#include <vector>

namespace WaitingRoom {

/// Issued queue position and the time it was handed out. Written once, never mutated.
struct QueuePositionEntry {
	std::string request_id;
	int64_t queue_position;
	int64_t entry_time;   // unix seconds
};

/// One historical value of the serving counter, keyed by (event_id, serving_counter).
struct ServingCounterIssuance {
	std::string event_id;
	int64_t serving_counter;
	int64_t issue_time;   // unix seconds
	int64_t queue_positions_served;
};

/// Names of the three durable tables, configurable per deployment
struct DurableTableNames {
	std::string token_table;
	std::string queue_position_entry_table;
	std::string serving_counter_issuance_table;
};

enum class AttributeType {
	STRING,
	NUMBER
};

struct KeyAttribute {
	std::string name;
	AttributeType type;
};

struct SecondaryIndex {
	std::string index_name;
	KeyAttribute hash_key;
	bool has_range_key = false;
	KeyAttribute range_key;
};

struct TableSchema {
	std::string table_name;
	KeyAttribute hash_key;
	bool has_range_key = false;
	KeyAttribute range_key;
	std::vector<SecondaryIndex> global_secondary_indexes;
	std::string billing_mode = "PAY_PER_REQUEST";
	bool sse_enabled = true;
};

enum class TableStatus {
	NOT_FOUND,
	CREATING,
	ACTIVE,
	DELETING
};

inline const char* TableStatusName(TableStatus status) {
	switch (status) {
		case TableStatus::NOT_FOUND: return "NOT_FOUND";
		case TableStatus::CREATING:  return "CREATING";
		case TableStatus::ACTIVE:    return "ACTIVE";
		case TableStatus::DELETING:  return "DELETING";
	}
	return "UNKNOWN";
}

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_RECORDS_H_
