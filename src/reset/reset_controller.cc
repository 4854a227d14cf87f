#include "reset_controller.h"

#include <glog/logging.h>

#include "absl/cleanup/cleanup.h"
#include "common/errors.h"
#include "store/table_schema.h"

namespace WaitingRoom {

const char* ControllerStateName(ControllerState state) {
	switch (state) {
		case ControllerState::IDLE:      return "IDLE";
		case ControllerState::RESETTING: return "RESETTING";
	}
	return "UNKNOWN";
}

ResetController::ResetController(CounterStoreAdapter& counters, ITableAdmin& admin,
		WriteGate& gate, ResetOptions options)
	: counters_(counters),
	  gate_(gate),
	  options_(std::move(options)),
	  rebuilder_(admin, options_.waiter) {}

absl::Status ResetController::Recover() {
	auto in_progress = counters_.IsResetInProgress();
	if (!in_progress.ok()) {
		return in_progress.status();
	}
	absl::MutexLock lock(&mutex_);
	state_ = *in_progress ? ControllerState::RESETTING : ControllerState::IDLE;
	if (*in_progress) {
		LOG(WARNING) << "reset_in_progress is set; reconciliation stays frozen until a reset completes";
	}
	return absl::OkStatus();
}

ControllerState ResetController::state() const {
	absl::MutexLock lock(&mutex_);
	return state_;
}

absl::StatusOr<ResetResult> ResetController::Reset(absl::string_view event_id) {
	if (event_id != options_.event_id) {
		LOG(WARNING) << "Reset rejected: " << IdentityMismatch(event_id);
		return ResetResult{400, "", "Invalid event ID"};
	}

	{
		absl::MutexLock lock(&mutex_);
		if (running_) {
			return ResetBusy();
		}
		running_ = true;
		state_ = ControllerState::RESETTING;
	}
	auto done = absl::MakeCleanup([this]() {
			absl::MutexLock lock(&mutex_);
			running_ = false;
			});

	absl::Status status = RunReset();
	if (!status.ok()) {
		LOG(ERROR) << "Reset failed, system left frozen: " << status;
		return status;
	}

	{
		absl::MutexLock lock(&mutex_);
		state_ = ControllerState::IDLE;
	}
	LOG(INFO) << "Reset completed";
	return ResetResult{200, "Reset completed", ""};
}

absl::Status ResetController::RunReset() {
	const auto deadline = std::chrono::steady_clock::now() + options_.overall_timeout;

	absl::Status frozen;
	{
		// Waits out a reconciliation pass or admission write that saw the flag clear
		absl::MutexLock lock(gate_.mutex());
		frozen = counters_.SetResetInProgress(true);
	}
	if (!frozen.ok()) {
		return frozen;
	}
	LOG(INFO) << "Reset in progress";

	for (CounterKey key : kResettableCounterKeys) {
		auto previous = counters_.Write(key, 0);
		if (!previous.ok()) {
			return previous.status();
		}
		VLOG(1) << CounterKeyName(key) << " reset from " << *previous;
	}
	LOG(INFO) << "Counters reset";

	const TableSchema schemas[] = {
		TokenTableSchema(options_.tables.token_table),
		QueuePositionEntryTableSchema(options_.tables.queue_position_entry_table),
		ServingCounterIssuanceTableSchema(options_.tables.serving_counter_issuance_table),
	};
	for (const TableSchema& schema : schemas) {
		absl::Status rebuilt = rebuilder_.Rebuild(schema, deadline);
		if (!rebuilt.ok()) {
			return rebuilt;
		}
	}
	LOG(INFO) << "Durable tables recreated";

	return counters_.SetResetInProgress(false);
}

} // namespace WaitingRoom
