#ifndef WAITINGROOM_COUNTERS_H_
#define WAITINGROOM_COUNTERS_H_

#include <array>
#include <optional>

#include "absl/strings/string_view.h"

namespace WaitingRoom {

/// Named counters kept in the fast counter store
enum class CounterKey {
	QUEUE_COUNTER,
	SERVING_COUNTER,
	TOKEN_COUNTER,
	MAX_QUEUE_POSITION_EXPIRED,
	RESET_IN_PROGRESS,
	ABANDONED_SESSION_COUNTER,
	COMPLETED_SESSION_COUNTER
};

inline constexpr std::array<CounterKey, 7> kAllCounterKeys = {
	CounterKey::QUEUE_COUNTER,
	CounterKey::SERVING_COUNTER,
	CounterKey::TOKEN_COUNTER,
	CounterKey::MAX_QUEUE_POSITION_EXPIRED,
	CounterKey::RESET_IN_PROGRESS,
	CounterKey::ABANDONED_SESSION_COUNTER,
	CounterKey::COMPLETED_SESSION_COUNTER,
};

/// Counters zeroed by a full reset. reset_in_progress is driven separately.
inline constexpr std::array<CounterKey, 6> kResettableCounterKeys = {
	CounterKey::SERVING_COUNTER,
	CounterKey::QUEUE_COUNTER,
	CounterKey::TOKEN_COUNTER,
	CounterKey::COMPLETED_SESSION_COUNTER,
	CounterKey::ABANDONED_SESSION_COUNTER,
	CounterKey::MAX_QUEUE_POSITION_EXPIRED,
};

/// Store key of a counter, e.g. "serving_counter"
absl::string_view CounterKeyName(CounterKey key);

std::optional<CounterKey> ParseCounterKey(absl::string_view name);

} // namespace WaitingRoom

#endif // WAITINGROOM_COUNTERS_H_
