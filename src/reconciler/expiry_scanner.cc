#include "expiry_scanner.h"

#include <algorithm>

#include <glog/logging.h>

namespace WaitingRoom {

const char* OutcomeName(ScanReport::Outcome outcome) {
	switch (outcome) {
		case ScanReport::Outcome::RESET_IN_PROGRESS:    return "RESET_IN_PROGRESS";
		case ScanReport::Outcome::NOTHING_ELIGIBLE:     return "NOTHING_ELIGIBLE";
		case ScanReport::Outcome::QUEUE_POSITION_GAP:   return "QUEUE_POSITION_GAP";
		case ScanReport::Outcome::WITHIN_GRACE_PERIOD:  return "WITHIN_GRACE_PERIOD";
		case ScanReport::Outcome::CANDIDATES_EXHAUSTED: return "CANDIDATES_EXHAUSTED";
	}
	return "UNKNOWN";
}

ExpiryScanner::ExpiryScanner(CounterStoreAdapter& counters, IDurableIndex& index,
		CounterAdvancer& advancer, const IClock& clock, WriteGate& gate,
		ScannerOptions options)
	: counters_(counters),
	  index_(index),
	  advancer_(advancer),
	  clock_(clock),
	  gate_(gate),
	  options_(std::move(options)) {}

absl::StatusOr<ScanReport> ExpiryScanner::ReconcileExpiredPositions() {
	absl::MutexLock lock(&pass_mutex_);
	absl::ReaderMutexLock gate(gate_.mutex());
	auto report = RunPass();
	if (!report.ok()) {
		LOG(ERROR) << "Expiry reconciliation pass aborted: " << report.status();
	} else {
		VLOG(1) << "Expiry reconciliation pass finished: " << OutcomeName(report->outcome)
			<< " watermark " << report->watermark_before << " -> " << report->watermark_after;
	}
	return report;
}

absl::StatusOr<ScanReport> ExpiryScanner::RunPass() {
	ScanReport report;

	auto reset_in_progress = counters_.IsResetInProgress();
	if (!reset_in_progress.ok()) {
		return reset_in_progress.status();
	}
	if (*reset_in_progress) {
		LOG(INFO) << "Reset in progress. Skipping execution";
		report.outcome = ScanReport::Outcome::RESET_IN_PROGRESS;
		return report;
	}

	int64_t now = clock_.NowSeconds();

	auto watermark = counters_.Read(CounterKey::MAX_QUEUE_POSITION_EXPIRED);
	if (!watermark.ok()) {
		return watermark.status();
	}
	auto serving_counter = counters_.Read(CounterKey::SERVING_COUNTER);
	if (!serving_counter.ok()) {
		return serving_counter.status();
	}
	auto queue_counter = counters_.Read(CounterKey::QUEUE_COUNTER);
	if (!queue_counter.ok()) {
		return queue_counter.status();
	}
	LOG(INFO) << "Queue counter: " << *queue_counter
		<< ". Max position expired: " << *watermark
		<< ". Serving counter: " << *serving_counter;

	report.watermark_before = *watermark;
	report.watermark_after = *watermark;

	auto candidates = index_.QueryServingIssuancesAfter(options_.event_id, *watermark);
	if (!candidates.ok()) {
		return candidates.status();
	}
	if (candidates->empty()) {
		LOG(INFO) << "No serving counter items eligible";
		report.outcome = ScanReport::Outcome::NOTHING_ELIGIBLE;
		return report;
	}

	int64_t previous_serving_position = *watermark;
	bool credit = options_.increment_on_expiry;
	report.outcome = ScanReport::Outcome::CANDIDATES_EXHAUSTED;

	for (const ServingCounterIssuance& candidate : *candidates) {
		auto entry = index_.FindQueuePositionEntry(candidate.serving_counter);
		if (!entry.ok()) {
			return entry.status();
		}
		if (!entry->has_value()) {
			LOG(WARNING) << "No queue position entry for serving counter position "
				<< candidate.serving_counter << ", stopping at the gap";
			report.outcome = ScanReport::Outcome::QUEUE_POSITION_GAP;
			break;
		}

		// Issuance records can lag the entry they serve
		int64_t queue_time = std::max((*entry)->entry_time, candidate.issue_time);
		if (now - queue_time < options_.expiry_period_seconds) {
			VLOG(2) << "Position " << candidate.serving_counter << " queued at " << queue_time
				<< " is within its grace period";
			report.outcome = ScanReport::Outcome::WITHIN_GRACE_PERIOD;
			break;
		}

		auto held = counters_.Raise(CounterKey::MAX_QUEUE_POSITION_EXPIRED, candidate.serving_counter);
		if (!held.ok()) {
			return held.status();
		}
		if (*held == candidate.serving_counter) {
			LOG(INFO) << "Max queue expiry position set to: " << candidate.serving_counter;
		} else {
			LOG(WARNING) << "Failed to set max queue position expired to " << candidate.serving_counter
				<< ": current value " << *held;
			if (credit) {
				// Another pass already expired this position and credited the serving counter for it
				LOG(WARNING) << "Watermark is ahead of this pass, serving counter crediting stopped";
				credit = false;
			}
		}
		report.watermark_after = candidate.serving_counter;
		report.positions_expired++;

		if (credit) {
			auto applied = advancer_.AdvanceServingCounter(candidate.queue_positions_served,
					candidate.serving_counter, previous_serving_position);
			if (!applied.ok()) {
				return applied.status();
			}
			if (*applied > 0) {
				report.serving_counter_increments++;
			}
		}

		previous_serving_position = candidate.serving_counter;
	}

	return report;
}

} // namespace WaitingRoom
