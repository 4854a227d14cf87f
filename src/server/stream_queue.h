#ifndef WAITINGROOM_SERVER_STREAM_QUEUE_H_
#define WAITINGROOM_SERVER_STREAM_QUEUE_H_

#include <cstddef>
#include <cstdint>
#include <deque>

#include <glog/logging.h>

#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "events/event_publisher.h"

namespace WaitingRoom {

/**
 * Events queued for one SubscribeEvents stream between bus delivery and the writer.
 * Holds at most capacity events; a full queue drops its oldest event.
 */
class StreamQueue {
	public:
		explicit StreamQueue(size_t capacity) : capacity_(capacity) {}

		void Push(const EventEnvelope& event) {
			absl::MutexLock lock(&mutex_);
			if (capacity_ == 0) {
				dropped_++;
				return;
			}
			if (pending_.size() >= capacity_) {
				pending_.pop_front();
				dropped_++;
				LOG_EVERY_N(WARNING, 100) << "Event subscriber is falling behind, dropped "
					<< dropped_ << " events so far";
			}
			pending_.push_back(event);
		}

		// Waits up to timeout for an event
		bool Pop(EventEnvelope* event, absl::Duration timeout) {
			absl::MutexLock lock(&mutex_);
			mutex_.AwaitWithTimeout(absl::Condition(this, &StreamQueue::HasPending), timeout);
			if (pending_.empty()) {
				return false;
			}
			*event = std::move(pending_.front());
			pending_.pop_front();
			return true;
		}

		size_t size() const {
			absl::MutexLock lock(&mutex_);
			return pending_.size();
		}

		uint64_t dropped() const {
			absl::MutexLock lock(&mutex_);
			return dropped_;
		}

	private:
		bool HasPending() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) { return !pending_.empty(); }

		const size_t capacity_;
		mutable absl::Mutex mutex_;
		std::deque<EventEnvelope> pending_ ABSL_GUARDED_BY(mutex_);
		uint64_t dropped_ ABSL_GUARDED_BY(mutex_) = 0;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_SERVER_STREAM_QUEUE_H_
