#include "admission_recorder.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "common/errors.h"

namespace WaitingRoom {

AdmissionRecorder::AdmissionRecorder(CounterStoreAdapter& counters, IDurableIndex& index,
		const IClock& clock, WriteGate& gate, std::string event_id)
	: counters_(counters),
	  index_(index),
	  clock_(clock),
	  gate_(gate),
	  event_id_(std::move(event_id)) {}

absl::Status AdmissionRecorder::CheckNotFrozen() {
	auto reset_in_progress = counters_.IsResetInProgress();
	if (!reset_in_progress.ok()) {
		return reset_in_progress.status();
	}
	if (*reset_in_progress) {
		return ResetInProgress();
	}
	return absl::OkStatus();
}

absl::StatusOr<QueuePositionEntry> AdmissionRecorder::AssignQueuePosition(const std::string& request_id) {
	if (request_id.empty()) {
		return absl::InvalidArgumentError("request id must not be empty");
	}

	absl::MutexLock lock(&assign_mutex_);
	absl::ReaderMutexLock gate(gate_.mutex());
	absl::Status frozen = CheckNotFrozen();
	if (!frozen.ok()) {
		return frozen;
	}

	auto existing = index_.FindQueuePositionEntryByRequest(request_id);
	if (!existing.ok()) {
		return existing.status();
	}
	if (existing->has_value()) {
		VLOG(1) << "Request " << request_id << " already holds queue position " << (*existing)->queue_position;
		return **existing;
	}

	auto position = counters_.IncrementBy(CounterKey::QUEUE_COUNTER, 1);
	if (!position.ok()) {
		return position.status();
	}
	QueuePositionEntry entry{request_id, *position, clock_.NowSeconds()};
	absl::Status recorded = index_.PutQueuePositionEntry(entry);
	if (!recorded.ok()) {
		// The position stays consumed; the scanner halts at it only if it is ever served
		LOG(ERROR) << "Recording queue position " << *position << " for " << request_id
			<< " failed: " << recorded;
		return recorded;
	}
	VLOG(1) << "Queue position " << entry.queue_position << " assigned to " << request_id;
	return entry;
}

absl::StatusOr<ServingCounterIssuance> AdmissionRecorder::IncrementServingCounter(int64_t increment_by,
		int64_t queue_positions_served) {
	if (increment_by <= 0) {
		return absl::InvalidArgumentError(absl::StrCat("increment must be positive, got ", increment_by));
	}
	if (queue_positions_served < 0 || queue_positions_served > increment_by) {
		return absl::InvalidArgumentError(absl::StrCat("queue positions served must be within [0, ",
					increment_by, "], got ", queue_positions_served));
	}

	absl::ReaderMutexLock gate(gate_.mutex());
	absl::Status frozen = CheckNotFrozen();
	if (!frozen.ok()) {
		return frozen;
	}

	auto current = counters_.IncrementBy(CounterKey::SERVING_COUNTER, increment_by);
	if (!current.ok()) {
		return current.status();
	}
	ServingCounterIssuance issuance{event_id_, *current, clock_.NowSeconds(), queue_positions_served};
	absl::Status appended = index_.PutServingIssuance(issuance);
	if (!appended.ok()) {
		LOG(ERROR) << "Recording serving counter issuance " << *current << " failed: " << appended;
		return appended;
	}
	LOG(INFO) << "Serving counter incremented by " << increment_by << ". Current value: " << *current;
	return issuance;
}

} // namespace WaitingRoom
