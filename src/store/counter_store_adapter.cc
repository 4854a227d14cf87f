#include "counter_store_adapter.h"

#include <glog/logging.h>

namespace WaitingRoom {

absl::StatusOr<int64_t> CounterStoreAdapter::Read(CounterKey key) {
	auto value = store_.Get(CounterKeyName(key));
	if (!value.ok()) {
		return value.status();
	}
	return value->value_or(0);
}

absl::StatusOr<int64_t> CounterStoreAdapter::Write(CounterKey key, int64_t value) {
	auto previous = store_.Set(CounterKeyName(key), value);
	if (!previous.ok()) {
		return previous.status();
	}
	VLOG(2) << CounterKeyName(key) << ": " << previous->value_or(0) << " -> " << value;
	return previous->value_or(0);
}

absl::StatusOr<int64_t> CounterStoreAdapter::IncrementBy(CounterKey key, int64_t delta) {
	return store_.IncrBy(CounterKeyName(key), delta);
}

absl::StatusOr<int64_t> CounterStoreAdapter::Raise(CounterKey key, int64_t value) {
	return store_.SetIfGreater(CounterKeyName(key), value);
}

absl::StatusOr<bool> CounterStoreAdapter::IsResetInProgress() {
	auto flag = Read(CounterKey::RESET_IN_PROGRESS);
	if (!flag.ok()) {
		return flag.status();
	}
	return *flag != 0;
}

absl::Status CounterStoreAdapter::SetResetInProgress(bool in_progress) {
	return Write(CounterKey::RESET_IN_PROGRESS, in_progress ? 1 : 0).status();
}

absl::StatusOr<absl::flat_hash_map<CounterKey, int64_t>> CounterStoreAdapter::ReadAll() {
	absl::flat_hash_map<CounterKey, int64_t> counters;
	for (CounterKey key : kAllCounterKeys) {
		auto value = Read(key);
		if (!value.ok()) {
			return value.status();
		}
		counters[key] = *value;
	}
	return counters;
}

} // namespace WaitingRoom
