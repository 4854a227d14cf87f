#ifndef WAITINGROOM_STORE_WRITE_GATE_H_
#define WAITINGROOM_STORE_WRITE_GATE_H_

#include "absl/synchronization/mutex.h"

namespace WaitingRoom {

/**
 * Orders in-process writers against the reset freeze.
 *
 * A writer holds the gate shared from its reset_in_progress check through its last
 * write. The reset controller holds it exclusively while it raises the flag, so once
 * the flag is visible no writer that read it as clear is still running.
 */
class WriteGate {
	public:
		WriteGate() = default;
		WriteGate(const WriteGate&) = delete;
		WriteGate& operator=(const WriteGate&) = delete;

		absl::Mutex* mutex() ABSL_LOCK_RETURNED(mutex_) { return &mutex_; }

	private:
		absl::Mutex mutex_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_STORE_WRITE_GATE_H_
