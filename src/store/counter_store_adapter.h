#ifndef WAITINGROOM_STORE_COUNTER_STORE_ADAPTER_H_
#define WAITINGROOM_STORE_COUNTER_STORE_ADAPTER_H_

#include <cstdint>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "common/counters.h"
#include "interfaces.h"

namespace WaitingRoom {

/**
 * Typed view of the counter store. Absent counters read as 0.
 * Does not own the store.
 */
class CounterStoreAdapter {
	public:
		explicit CounterStoreAdapter(ICounterStore& store) : store_(store) {}

		absl::StatusOr<int64_t> Read(CounterKey key);

		/// Unconditional set, returns the previous value (0 when absent)
		absl::StatusOr<int64_t> Write(CounterKey key, int64_t value);

		absl::StatusOr<int64_t> IncrementBy(CounterKey key, int64_t delta);

		/// Monotonic set, returns the value held afterwards
		absl::StatusOr<int64_t> Raise(CounterKey key, int64_t value);

		absl::StatusOr<bool> IsResetInProgress();
		absl::Status SetResetInProgress(bool in_progress);

		/// Snapshot of every known counter
		absl::StatusOr<absl::flat_hash_map<CounterKey, int64_t>> ReadAll();

	private:
		ICounterStore& store_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_COUNTER_STORE_ADAPTER_H_
