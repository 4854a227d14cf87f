#ifndef WAITINGROOM_ADMISSION_ADMISSION_RECORDER_H_
#define WAITINGROOM_ADMISSION_ADMISSION_RECORDER_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "common/clock.h"
#include "store/counter_store_adapter.h"
#include "store/interfaces.h"
#include "store/write_gate.h"

namespace WaitingRoom {

/**
 * Write side of the queue: hands out queue positions and advances the serving counter
 * on behalf of the front end, recording each change in the durable index the expiry
 * scanner reads.
 *
 * Both writes are refused while reset_in_progress is set.
 */
class AdmissionRecorder {
	public:
		AdmissionRecorder(CounterStoreAdapter& counters, IDurableIndex& index,
				const IClock& clock, WriteGate& gate, std::string event_id);

		/// Position of request_id in the queue. A request that already holds a position gets
		/// the same entry back.
		absl::StatusOr<QueuePositionEntry> AssignQueuePosition(const std::string& request_id);

		/// Lets increment_by more positions through and records the new serving counter value.
		/// queue_positions_served is the part of that range already served (0 <= served <= increment_by).
		absl::StatusOr<ServingCounterIssuance> IncrementServingCounter(int64_t increment_by,
				int64_t queue_positions_served);

	private:
		absl::Status CheckNotFrozen();

		CounterStoreAdapter& counters_;
		IDurableIndex& index_;
		const IClock& clock_;
		WriteGate& gate_;
		const std::string event_id_;

		// One assignment at a time, so a repeated request id cannot burn a second position
		absl::Mutex assign_mutex_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_ADMISSION_ADMISSION_RECORDER_H_
