#include "table_schema.h"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"

namespace WaitingRoom {

TableSchema TokenTableSchema(const std::string& table_name) {
	TableSchema schema;
	schema.table_name = table_name;
	schema.hash_key = {"request_id", AttributeType::STRING};

	SecondaryIndex event_expires;
	event_expires.index_name = kEventExpiresIndex;
	event_expires.hash_key = {"event_id", AttributeType::STRING};
	event_expires.has_range_key = true;
	event_expires.range_key = {"expires", AttributeType::NUMBER};
	schema.global_secondary_indexes.push_back(event_expires);
	return schema;
}

TableSchema QueuePositionEntryTableSchema(const std::string& table_name) {
	TableSchema schema;
	schema.table_name = table_name;
	schema.hash_key = {"request_id", AttributeType::STRING};

	SecondaryIndex queue_position;
	queue_position.index_name = kQueuePositionIndex;
	queue_position.hash_key = {"queue_position", AttributeType::NUMBER};
	schema.global_secondary_indexes.push_back(queue_position);
	return schema;
}

TableSchema ServingCounterIssuanceTableSchema(const std::string& table_name) {
	TableSchema schema;
	schema.table_name = table_name;
	schema.hash_key = {"event_id", AttributeType::STRING};
	schema.has_range_key = true;
	schema.range_key = {"serving_counter", AttributeType::NUMBER};
	return schema;
}

absl::Status ValidateSchema(const TableSchema& schema) {
	if (schema.table_name.empty()) {
		return absl::InvalidArgumentError("table name is empty");
	}
	if (schema.hash_key.name.empty()) {
		return absl::InvalidArgumentError(absl::StrCat(schema.table_name, ": hash key is missing"));
	}
	if (schema.has_range_key && schema.range_key.name.empty()) {
		return absl::InvalidArgumentError(absl::StrCat(schema.table_name, ": range key is unnamed"));
	}
	if (!schema.sse_enabled) {
		return absl::InvalidArgumentError(absl::StrCat(schema.table_name, ": encryption at rest is required"));
	}

	absl::flat_hash_set<std::string> index_names;
	for (const auto& index : schema.global_secondary_indexes) {
		if (index.index_name.empty() || index.hash_key.name.empty()) {
			return absl::InvalidArgumentError(absl::StrCat(schema.table_name, ": incomplete secondary index"));
		}
		if (!index_names.insert(index.index_name).second) {
			return absl::InvalidArgumentError(absl::StrCat(schema.table_name, ": duplicate index ", index.index_name));
		}
	}
	return absl::OkStatus();
}

} // namespace WaitingRoom
