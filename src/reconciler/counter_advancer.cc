#include "counter_advancer.h"

#include <glog/logging.h>

namespace WaitingRoom {

CounterAdvancer::CounterAdvancer(CounterStoreAdapter& counters, IDurableIndex& index,
		IEventPublisher& publisher, const IClock& clock, AdvancerOptions options)
	: counters_(counters),
	  index_(index),
	  publisher_(publisher),
	  clock_(clock),
	  options_(std::move(options)) {}

absl::StatusOr<int64_t> CounterAdvancer::AdvanceServingCounter(int64_t queue_positions_served,
		int64_t expired_position, int64_t previous_serving_position) {
	int64_t increment_by = ComputeIncrement(queue_positions_served, expired_position,
			previous_serving_position);

	if (increment_by <= 0) {
		LOG(WARNING) << "Increment value calculated as " << increment_by
			<< " (expired position " << expired_position
			<< ", previous position " << previous_serving_position
			<< ", served " << queue_positions_served
			<< "), incrementing serving counter skipped";
		return int64_t{0};
	}

	auto current = counters_.IncrementBy(CounterKey::SERVING_COUNTER, increment_by);
	if (!current.ok()) {
		LOG(ERROR) << "Serving counter increment by " << increment_by << " failed: " << current.status();
		return current.status();
	}

	int64_t now = clock_.NowSeconds();
	ServingCounterIssuance issuance{options_.event_id, *current, now, 0};
	absl::Status appended = index_.PutServingIssuance(issuance);
	if (!appended.ok()) {
		// The increment stands; the next pass works from the durable log as it is
		LOG(ERROR) << "Recording serving counter issuance " << *current << " failed: " << appended;
		return appended;
	}

	LOG(INFO) << "Serving counter incremented by " << increment_by << ". Current value: " << *current;
	Notify(increment_by, *current, now);
	return increment_by;
}

void CounterAdvancer::Notify(int64_t increment_by, int64_t current_position, int64_t now) {
	auto event = MakeIncrementEvent(options_.tags, current_position - increment_by,
			increment_by, current_position, now);
	if (!event.ok()) {
		LOG(WARNING) << "Dropping serving counter notification: " << event.status();
		return;
	}
	absl::Status published = publisher_.Publish(*event);
	if (!published.ok()) {
		LOG(WARNING) << "Publishing serving counter notification failed: " << published;
	}
}

} // namespace WaitingRoom
