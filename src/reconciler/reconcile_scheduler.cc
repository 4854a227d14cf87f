#include "reconcile_scheduler.h"

#include <glog/logging.h>

#include "absl/time/time.h"

namespace WaitingRoom {

void ReconcileScheduler::Start() {
	absl::MutexLock lock(&mutex_);
	if (running_) {
		return;
	}
	running_ = true;
	shutdown_ = false;
	thread_ = std::thread(&ReconcileScheduler::Loop, this);
	LOG(INFO) << "[ReconcileScheduler] Started with interval " << interval_.count() << "ms";
}

void ReconcileScheduler::Stop() {
	{
		absl::MutexLock lock(&mutex_);
		if (!running_) {
			return;
		}
		shutdown_ = true;
	}
	if (thread_.joinable()) {
		thread_.join();
	}
	absl::MutexLock lock(&mutex_);
	running_ = false;
	LOG(INFO) << "[ReconcileScheduler] Stopped after " << passes_run_ << " passes";
}

uint64_t ReconcileScheduler::PassesRun() const {
	absl::MutexLock lock(&mutex_);
	return passes_run_;
}

uint64_t ReconcileScheduler::PassesFailed() const {
	absl::MutexLock lock(&mutex_);
	return passes_failed_;
}

void ReconcileScheduler::Loop() {
	const absl::Duration interval = absl::FromChrono(interval_);
	while (true) {
		auto report = scanner_.ReconcileExpiredPositions();

		absl::MutexLock lock(&mutex_);
		passes_run_++;
		if (!report.ok()) {
			passes_failed_++;
		}
		// Sleep one interval, waking early on shutdown
		mutex_.AwaitWithTimeout(absl::Condition(&shutdown_), interval);
		if (shutdown_) {
			return;
		}
	}
}

} // namespace WaitingRoom
