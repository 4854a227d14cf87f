#include "table_rebuilder.h"

#include <algorithm>
#include <thread>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace WaitingRoom {

absl::Status TableRebuilder::WaitForTableStatus(const std::string& table_name,
		TableStatus target, Deadline deadline) {
	const auto start = std::chrono::steady_clock::now();
	Deadline limit = deadline;
	if (start < Deadline::max() - options_.timeout) {
		limit = std::min(deadline, start + options_.timeout);
	}

	int polls = 0;
	while (true) {
		auto status = admin_.DescribeTable(table_name);
		if (!status.ok()) {
			return status.status();
		}
		polls++;
		if (*status == target) {
			VLOG(2) << "Table " << table_name << " reached " << TableStatusName(target)
				<< " after " << polls << " polls";
			return absl::OkStatus();
		}

		if (std::chrono::steady_clock::now() + options_.poll_interval > limit) {
			LOG(ERROR) << "Timed out waiting for table " << table_name << " to become "
				<< TableStatusName(target) << ", last seen " << TableStatusName(*status);
			return RebuildTimeout(absl::StrCat("table ", table_name, " did not reach ",
						TableStatusName(target), " (last seen ", TableStatusName(*status), ")"));
		}
		std::this_thread::sleep_for(options_.poll_interval);
	}
}

absl::Status TableRebuilder::Rebuild(const TableSchema& schema, Deadline deadline) {
	const std::string& name = schema.table_name;

	auto current = admin_.DescribeTable(name);
	if (!current.ok()) {
		return RebuildFailure(absl::StrCat("describe ", name), current.status());
	}

	if (*current != TableStatus::NOT_FOUND) {
		if (*current != TableStatus::DELETING) {
			// A table still settling from an earlier attempt has to finish first
			if (*current == TableStatus::CREATING) {
				absl::Status settled = WaitForTableStatus(name, TableStatus::ACTIVE, deadline);
				if (!settled.ok()) {
					return RebuildFailure(absl::StrCat("settle ", name), settled);
				}
			}
			absl::Status deleted = admin_.DeleteTable(name);
			if (!deleted.ok()) {
				return RebuildFailure(absl::StrCat("delete ", name), deleted);
			}
		}
		absl::Status gone = WaitForTableStatus(name, TableStatus::NOT_FOUND, deadline);
		if (!gone.ok()) {
			return RebuildFailure(absl::StrCat("wait for deletion of ", name), gone);
		}
		LOG(INFO) << name << " table deleted";
	} else {
		LOG(INFO) << name << " table already absent";
	}

	absl::Status created = admin_.CreateTable(schema);
	if (!created.ok()) {
		return RebuildFailure(absl::StrCat("create ", name), created);
	}
	absl::Status active = WaitForTableStatus(name, TableStatus::ACTIVE, deadline);
	if (!active.ok()) {
		return RebuildFailure(absl::StrCat("wait for creation of ", name), active);
	}
	LOG(INFO) << name << " table recreated";

	absl::Status pitr = admin_.EnablePointInTimeRecovery(name);
	if (!pitr.ok()) {
		return RebuildFailure(absl::StrCat("enable point-in-time recovery on ", name), pitr);
	}
	return absl::OkStatus();
}

} // namespace WaitingRoom
