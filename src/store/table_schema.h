#ifndef WAITINGROOM_STORE_TABLE_SCHEMA_H_
#define WAITINGROOM_STORE_TABLE_SCHEMA_H_

#include <string>

#include "absl/status/status.h"
#include "records.h"

namespace WaitingRoom {

/// Name of the secondary index used for point lookups by queue position
inline constexpr char kQueuePositionIndex[] = "QueuePositionIndex";
inline constexpr char kEventExpiresIndex[] = "EventExpiresIndex";

/// request_id hash key, EventExpiresIndex on (event_id, expires)
TableSchema TokenTableSchema(const std::string& table_name);

/// request_id hash key, QueuePositionIndex on queue_position
TableSchema QueuePositionEntryTableSchema(const std::string& table_name);

/// (event_id, serving_counter) composite key
TableSchema ServingCounterIssuanceTableSchema(const std::string& table_name);

/// Structural checks every created table must pass, encryption at rest included
absl::Status ValidateSchema(const TableSchema& schema);

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_TABLE_SCHEMA_H_
