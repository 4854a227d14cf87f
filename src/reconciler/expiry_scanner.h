#ifndef WAITINGROOM_RECONCILER_EXPIRY_SCANNER_H_
#define WAITINGROOM_RECONCILER_EXPIRY_SCANNER_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "common/clock.h"
#include "counter_advancer.h"
#include "store/counter_store_adapter.h"
#include "store/interfaces.h"
#include "store/write_gate.h"

namespace WaitingRoom {

struct ScanReport {
	enum class Outcome {
		RESET_IN_PROGRESS,     // frozen by a reset, nothing was touched
		NOTHING_ELIGIBLE,      // no issuance above the watermark
		QUEUE_POSITION_GAP,    // an issuance had no queue position entry
		WITHIN_GRACE_PERIOD,   // stopped at the first candidate still inside its grace period
		CANDIDATES_EXHAUSTED   // every candidate expired
	};

	Outcome outcome = Outcome::NOTHING_ELIGIBLE;
	int64_t watermark_before = 0;
	int64_t watermark_after = 0;
	int64_t positions_expired = 0;
	int64_t serving_counter_increments = 0;
};

const char* OutcomeName(ScanReport::Outcome outcome);

struct ScannerOptions {
	std::string event_id;
	int64_t expiry_period_seconds = 900;
	/// Credit the serving counter for expired positions (indirect crediting)
	bool increment_on_expiry = false;
};

/**
 * Advances max_queue_position_expired over serving counter issuances whose queue
 * positions have outlived the grace period.
 *
 * One pass walks the issuance log above the persisted watermark in ascending order,
 * pairs each issuance with the queue position entry at the same position and expires
 * it when now - max(entry_time, issue_time) >= grace period. The pass stops at the
 * first issuance still inside its grace period or without a queue position entry.
 *
 * The watermark is written with a monotonic max-set, so overlapping passes from other
 * processes cannot move it backwards. A pass that finds the watermark already past
 * one of its candidates stops crediting, since that range was credited by the pass
 * that moved it. Passes within one process are serialized, and a pass holds the
 * write gate so a reset cannot start zeroing counters underneath it.
 * Any store error aborts the pass; everything written before it stays, and the next
 * pass resumes from the persisted watermark.
 */
class ExpiryScanner {
	public:
		ExpiryScanner(CounterStoreAdapter& counters, IDurableIndex& index,
				CounterAdvancer& advancer, const IClock& clock, WriteGate& gate,
				ScannerOptions options);

		absl::StatusOr<ScanReport> ReconcileExpiredPositions();

		const ScannerOptions& options() const { return options_; }

	private:
		absl::StatusOr<ScanReport> RunPass() ABSL_EXCLUSIVE_LOCKS_REQUIRED(pass_mutex_);

		CounterStoreAdapter& counters_;
		IDurableIndex& index_;
		CounterAdvancer& advancer_;
		const IClock& clock_;
		WriteGate& gate_;
		const ScannerOptions options_;

		absl::Mutex pass_mutex_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_RECONCILER_EXPIRY_SCANNER_H_
