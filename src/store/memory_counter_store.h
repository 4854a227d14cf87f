#ifndef WAITINGROOM_STORE_MEMORY_COUNTER_STORE_H_
#define WAITINGROOM_STORE_MEMORY_COUNTER_STORE_H_

#include <string>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"
#include "interfaces.h"

namespace WaitingRoom {

/**
 * Process-local counter store. Every operation is atomic under a single mutex,
 * which gives the same per-key guarantees a Redis backend gives per command.
 */
class InMemoryCounterStore : public ICounterStore {
	public:
		InMemoryCounterStore() = default;

		InMemoryCounterStore(const InMemoryCounterStore&) = delete;
		InMemoryCounterStore& operator=(const InMemoryCounterStore&) = delete;

		absl::StatusOr<std::optional<int64_t>> Get(absl::string_view key) override;
		absl::StatusOr<std::optional<int64_t>> Set(absl::string_view key, int64_t value) override;
		absl::StatusOr<int64_t> IncrBy(absl::string_view key, int64_t delta) override;
		absl::StatusOr<int64_t> SetIfGreater(absl::string_view key, int64_t value) override;

		size_t Size() const;

	private:
		mutable absl::Mutex mutex_;
		absl::flat_hash_map<std::string, int64_t> counters_ ABSL_GUARDED_BY(mutex_);
};

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_MEMORY_COUNTER_STORE_H_
