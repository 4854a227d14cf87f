#ifndef WAITINGROOM_RESET_TABLE_REBUILDER_H_
#define WAITINGROOM_RESET_TABLE_REBUILDER_H_

#include <chrono>
#include <string>

#include "absl/status/status.h"
#include "store/interfaces.h"

namespace WaitingRoom {

struct WaiterOptions {
	std::chrono::milliseconds poll_interval{200};
	std::chrono::milliseconds timeout{60000};
};

/**
 * Replaces a durable table: delete, wait until gone, recreate, wait until active,
 * enable point-in-time recovery. Every wait is a bounded poll loop.
 */
class TableRebuilder {
	public:
		using Deadline = std::chrono::steady_clock::time_point;

		TableRebuilder(ITableAdmin& admin, WaiterOptions options)
			: admin_(admin), options_(options) {}

		/// Polls DescribeTable until target is observed. Gives up at the earlier of the
		/// configured timeout and deadline with kDeadlineExceeded.
		absl::Status WaitForTableStatus(const std::string& table_name, TableStatus target,
				Deadline deadline = Deadline::max());

		/// A table that is already gone (an earlier attempt deleted it) is only recreated
		absl::Status Rebuild(const TableSchema& schema, Deadline deadline = Deadline::max());

	private:
		ITableAdmin& admin_;
		const WaiterOptions options_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_RESET_TABLE_REBUILDER_H_
