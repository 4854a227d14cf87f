#ifndef WAITINGROOM_RECONCILER_COUNTER_ADVANCER_H_
#define WAITINGROOM_RECONCILER_COUNTER_ADVANCER_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "common/clock.h"
#include "events/event_publisher.h"
#include "store/counter_store_adapter.h"
#include "store/interfaces.h"

namespace WaitingRoom {

struct AdvancerOptions {
	std::string event_id;
	EventTags tags;
};

/**
 * Credits the serving counter for queue positions that expired instead of completing.
 *
 * The increment for an expired issuance is the width of the gap between the previous
 * serving position and the expired one, minus the positions that issuance already
 * accounted for as served:
 *
 *     increment = (expired_position - previous_serving_position) - queue_positions_served
 *
 * A non-positive increment means upstream bookkeeping is inconsistent; it is logged and
 * never applied, so the serving counter cannot move backwards.
 */
class CounterAdvancer {
	public:
		CounterAdvancer(CounterStoreAdapter& counters, IDurableIndex& index,
				IEventPublisher& publisher, const IClock& clock, AdvancerOptions options);

		/// Returns the increment applied, 0 when skipped. Store failures are returned as errors;
		/// a notification that cannot be published is only logged.
		absl::StatusOr<int64_t> AdvanceServingCounter(int64_t queue_positions_served,
				int64_t expired_position, int64_t previous_serving_position);

		static int64_t ComputeIncrement(int64_t queue_positions_served,
				int64_t expired_position, int64_t previous_serving_position) {
			return (expired_position - previous_serving_position) - queue_positions_served;
		}

	private:
		void Notify(int64_t increment_by, int64_t current_position, int64_t now);

		CounterStoreAdapter& counters_;
		IDurableIndex& index_;
		IEventPublisher& publisher_;
		const IClock& clock_;
		const AdvancerOptions options_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_RECONCILER_COUNTER_ADVANCER_H_
