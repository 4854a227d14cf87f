#include "counters.h"

namespace WaitingRoom {

absl::string_view CounterKeyName(CounterKey key) {
	switch (key) {
		case CounterKey::QUEUE_COUNTER:
			return "queue_counter";
		case CounterKey::SERVING_COUNTER:
			return "serving_counter";
		case CounterKey::TOKEN_COUNTER:
			return "token_counter";
		case CounterKey::MAX_QUEUE_POSITION_EXPIRED:
			return "max_queue_position_expired";
		case CounterKey::RESET_IN_PROGRESS:
			return "reset_in_progress";
		case CounterKey::ABANDONED_SESSION_COUNTER:
			return "abandoned_session_counter";
		case CounterKey::COMPLETED_SESSION_COUNTER:
			return "completed_session_counter";
	}
	return "unknown";
}

std::optional<CounterKey> ParseCounterKey(absl::string_view name) {
	for (CounterKey key : kAllCounterKeys) {
		if (CounterKeyName(key) == name) {
			return key;
		}
	}
	return std::nullopt;
}

} // namespace WaitingRoom
