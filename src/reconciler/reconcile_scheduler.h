#ifndef WAITINGROOM_RECONCILER_RECONCILE_SCHEDULER_H_
#define WAITINGROOM_RECONCILER_RECONCILE_SCHEDULER_H_

#include <chrono>
#include <cstdint>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "expiry_scanner.h"

namespace WaitingRoom {

/**
 * Periodic trigger for the expiry scanner. A failed pass is logged and retried on the next tick.
 */
class ReconcileScheduler {
	public:
		ReconcileScheduler(ExpiryScanner& scanner, std::chrono::milliseconds interval)
			: scanner_(scanner), interval_(interval) {}

		~ReconcileScheduler() { Stop(); }

		ReconcileScheduler(const ReconcileScheduler&) = delete;
		ReconcileScheduler& operator=(const ReconcileScheduler&) = delete;

		void Start();
		void Stop();

		uint64_t PassesRun() const;
		uint64_t PassesFailed() const;

	private:
		void Loop();

		ExpiryScanner& scanner_;
		const std::chrono::milliseconds interval_;
		std::thread thread_;

		mutable absl::Mutex mutex_;
		bool running_ ABSL_GUARDED_BY(mutex_) = false;
		bool shutdown_ ABSL_GUARDED_BY(mutex_) = false;
		uint64_t passes_run_ ABSL_GUARDED_BY(mutex_) = 0;
		uint64_t passes_failed_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_RECONCILER_RECONCILE_SCHEDULER_H_
