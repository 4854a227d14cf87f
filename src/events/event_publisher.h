#ifndef WAITINGROOM_EVENTS_EVENT_PUBLISHER_H_
#define WAITINGROOM_EVENTS_EVENT_PUBLISHER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include <waitingroom.pb.h>

namespace WaitingRoom {

using waitingroom_control::EventEnvelope;
using waitingroom_control::ServingCounterIncrement;

/**
 * Sink for notifications. Publication is advisory: callers log a failure and move on,
 * the counter mutation that caused the event stays the source of truth.
 */
class IEventPublisher {
public:
	virtual ~IEventPublisher() = default;

	virtual absl::Status Publish(const EventEnvelope& event) = 0;
};

/// Fixed tags every notification carries
struct EventTags {
	std::string source;
	std::string detail_type;
	std::string event_bus_name;
};

/// Envelope for an automatic serving counter advancement; detail is the JSON of the increment
absl::StatusOr<EventEnvelope> MakeIncrementEvent(const EventTags& tags,
		int64_t previous_position, int64_t increment_by, int64_t current_position, int64_t now);

/**
 * Writes every event to the log
 */
class LogEventPublisher : public IEventPublisher {
public:
	absl::Status Publish(const EventEnvelope& event) override;
};

/**
 * Delivers each event to every registered publisher. A failing publisher does not stop the others;
 * the first failure is returned after all publishers were tried. Does not own the publishers.
 */
class FanoutEventPublisher : public IEventPublisher {
public:
	void AddPublisher(IEventPublisher* publisher) { publishers_.push_back(publisher); }

	absl::Status Publish(const EventEnvelope& event) override;

private:
	std::vector<IEventPublisher*> publishers_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_EVENTS_EVENT_PUBLISHER_H_
