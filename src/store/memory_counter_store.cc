#include "memory_counter_store.h"

#include <algorithm>

namespace WaitingRoom {

absl::StatusOr<std::optional<int64_t>> InMemoryCounterStore::Get(absl::string_view key) {
	absl::MutexLock lock(&mutex_);
	auto it = counters_.find(key);
	if (it == counters_.end()) {
		return std::optional<int64_t>();
	}
	return std::optional<int64_t>(it->second);
}

absl::StatusOr<std::optional<int64_t>> InMemoryCounterStore::Set(absl::string_view key, int64_t value) {
	absl::MutexLock lock(&mutex_);
	std::optional<int64_t> previous;
	auto it = counters_.find(key);
	if (it != counters_.end()) {
		previous = it->second;
		it->second = value;
	} else {
		counters_.emplace(std::string(key), value);
	}
	return previous;
}

absl::StatusOr<int64_t> InMemoryCounterStore::IncrBy(absl::string_view key, int64_t delta) {
	absl::MutexLock lock(&mutex_);
	auto [it, inserted] = counters_.try_emplace(std::string(key), 0);
	it->second += delta;
	return it->second;
}

absl::StatusOr<int64_t> InMemoryCounterStore::SetIfGreater(absl::string_view key, int64_t value) {
	absl::MutexLock lock(&mutex_);
	auto [it, inserted] = counters_.try_emplace(std::string(key), value);
	if (!inserted) {
		it->second = std::max(it->second, value);
	}
	return it->second;
}

size_t InMemoryCounterStore::Size() const {
	absl::MutexLock lock(&mutex_);
	return counters_.size();
}

} // namespace WaitingRoom
