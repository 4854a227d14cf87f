#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/synchronization/mutex.h"
#include "event_publisher.h"

namespace WaitingRoom {

/**
 * Worker pool that runs posted tasks in submission order per worker
 */
class AsyncCallbackExecutor {
public:
	explicit AsyncCallbackExecutor(size_t num_threads = 1);
	~AsyncCallbackExecutor();

	/// Returns false once the executor is stopped
	bool Post(std::function<void()> task);

	/// Runs the tasks already queued, then joins the workers
	void Stop();

private:
	void WorkerThread();

	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;
	std::mutex queue_mutex_;
	std::condition_variable condition_;
	std::atomic<bool> stop_{false};
};

/**
 * In-process publish/subscribe bus for notifications.
 * Publish never blocks on subscribers: each delivery is posted to the executor.
 * With the default single worker every subscriber sees events in publication order.
 */
class EventBus : public IEventPublisher {
public:
	using Handler = std::function<void(const EventEnvelope&)>;
	using SubscriptionId = uint64_t;

	explicit EventBus(size_t num_threads = 1) : executor_(num_threads) {}
	~EventBus() override { Stop(); }

	EventBus(const EventBus&) = delete;
	EventBus& operator=(const EventBus&) = delete;

	SubscriptionId Subscribe(Handler handler);
	void Unsubscribe(SubscriptionId id);
	size_t NumSubscribers() const;

	absl::Status Publish(const EventEnvelope& event) override;

	void Stop();

private:
	AsyncCallbackExecutor executor_;

	mutable absl::Mutex mutex_;
	SubscriptionId next_id_ ABSL_GUARDED_BY(mutex_) = 1;
	absl::btree_map<SubscriptionId, std::shared_ptr<Handler>> handlers_ ABSL_GUARDED_BY(mutex_);
};

} // namespace WaitingRoom
