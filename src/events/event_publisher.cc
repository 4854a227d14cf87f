#include "event_publisher.h"

#include <glog/logging.h>
#include <google/protobuf/util/json_util.h>

namespace WaitingRoom {

absl::StatusOr<EventEnvelope> MakeIncrementEvent(const EventTags& tags,
		int64_t previous_position, int64_t increment_by, int64_t current_position, int64_t now) {
	EventEnvelope event;
	event.set_source(tags.source);
	event.set_detail_type(tags.detail_type);
	event.set_event_bus_name(tags.event_bus_name);
	event.set_time(now);

	ServingCounterIncrement* increment = event.mutable_increment();
	increment->set_previous_serving_counter_position(previous_position);
	increment->set_increment_by(increment_by);
	increment->set_current_serving_counter_position(current_position);

	google::protobuf::util::JsonPrintOptions options;
	options.preserve_proto_field_names = true;
	// previous position is legitimately 0 right after a reset
	options.always_print_primitive_fields = true;
	std::string detail;
	auto status = google::protobuf::util::MessageToJsonString(*increment, &detail, options);
	if (!status.ok()) {
		return absl::InternalError("failed to render event detail: " + status.ToString());
	}
	event.set_detail(detail);
	return event;
}

absl::Status LogEventPublisher::Publish(const EventEnvelope& event) {
	LOG(INFO) << "[" << event.event_bus_name() << "] " << event.source() << "/"
		<< event.detail_type() << " " << event.detail();
	return absl::OkStatus();
}

absl::Status FanoutEventPublisher::Publish(const EventEnvelope& event) {
	absl::Status first_failure;
	for (IEventPublisher* publisher : publishers_) {
		absl::Status status = publisher->Publish(event);
		if (!status.ok()) {
			LOG(WARNING) << "Event publisher failed: " << status;
			if (first_failure.ok()) {
				first_failure = status;
			}
		}
	}
	return first_failure;
}

} // namespace WaitingRoom
