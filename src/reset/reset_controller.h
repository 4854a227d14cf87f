#ifndef WAITINGROOM_RESET_RESET_CONTROLLER_H_
#define WAITINGROOM_RESET_RESET_CONTROLLER_H_

#include <chrono>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "store/counter_store_adapter.h"
#include "store/interfaces.h"
#include "store/write_gate.h"
#include "table_rebuilder.h"

namespace WaitingRoom {

enum class ControllerState {
	IDLE,
	RESETTING
};

const char* ControllerStateName(ControllerState state);

struct ResetOptions {
	std::string event_id;
	DurableTableNames tables;
	WaiterOptions waiter;
	std::chrono::milliseconds overall_timeout{300000};
};

/// Reply to a reset trigger: 200 on success, 400 on identity mismatch
struct ResetResult {
	int status_code;
	std::string message;
	std::string error;
};

/**
 * Full-system reset: IDLE -> RESETTING -> IDLE.
 *
 * Raises reset_in_progress (freezing reconciliation and admission writes) once every
 * in-flight writer has left the write gate, then zeroes every counter and rebuilds
 * the token, queue position entry and serving counter issuance tables. Only a complete
 * run clears the flag. On any failure the error is returned and the system stays in
 * RESETTING until an operator retries.
 */
class ResetController {
	public:
		ResetController(CounterStoreAdapter& counters, ITableAdmin& admin, WriteGate& gate,
				ResetOptions options);

		/// Adopts the persisted reset_in_progress flag, so a restart during a reset stays frozen
		absl::Status Recover();

		absl::StatusOr<ResetResult> Reset(absl::string_view event_id);

		ControllerState state() const;

	private:
		absl::Status RunReset();

		CounterStoreAdapter& counters_;
		WriteGate& gate_;
		const ResetOptions options_;
		TableRebuilder rebuilder_;

		mutable absl::Mutex mutex_;
		ControllerState state_ ABSL_GUARDED_BY(mutex_) = ControllerState::IDLE;
		bool running_ ABSL_GUARDED_BY(mutex_) = false;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_RESET_RESET_CONTROLLER_H_
