#include "event_bus.h"

#include <glog/logging.h>

namespace WaitingRoom {

AsyncCallbackExecutor::AsyncCallbackExecutor(size_t num_threads) {
	for (size_t i = 0; i < num_threads; ++i) {
		workers_.emplace_back(&AsyncCallbackExecutor::WorkerThread, this);
	}
}

AsyncCallbackExecutor::~AsyncCallbackExecutor() {
	Stop();
}

bool AsyncCallbackExecutor::Post(std::function<void()> task) {
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		if (stop_) {
			return false;
		}
		tasks_.emplace(std::move(task));
	}
	condition_.notify_one();
	return true;
}

void AsyncCallbackExecutor::Stop() {
	{
		std::lock_guard<std::mutex> lock(queue_mutex_);
		stop_ = true;
	}
	condition_.notify_all();

	for (auto& worker : workers_) {
		if (worker.joinable()) {
			worker.join();
		}
	}
}

void AsyncCallbackExecutor::WorkerThread() {
	while (true) {
		std::function<void()> task;

		{
			std::unique_lock<std::mutex> lock(queue_mutex_);
			condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

			if (stop_ && tasks_.empty()) {
				return;
			}

			task = std::move(tasks_.front());
			tasks_.pop();
		}

		task();
	}
}

EventBus::SubscriptionId EventBus::Subscribe(Handler handler) {
	absl::MutexLock lock(&mutex_);
	SubscriptionId id = next_id_++;
	handlers_.emplace(id, std::make_shared<Handler>(std::move(handler)));
	VLOG(1) << "Event bus subscriber " << id << " added";
	return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
	absl::MutexLock lock(&mutex_);
	handlers_.erase(id);
	VLOG(1) << "Event bus subscriber " << id << " removed";
}

size_t EventBus::NumSubscribers() const {
	absl::MutexLock lock(&mutex_);
	return handlers_.size();
}

absl::Status EventBus::Publish(const EventEnvelope& event) {
	std::vector<std::shared_ptr<Handler>> targets;
	{
		absl::MutexLock lock(&mutex_);
		targets.reserve(handlers_.size());
		for (const auto& entry : handlers_) {
			targets.push_back(entry.second);
		}
	}

	auto shared_event = std::make_shared<const EventEnvelope>(event);
	for (auto& handler : targets) {
		bool posted = executor_.Post([handler, shared_event]() {
				(*handler)(*shared_event);
				});
		if (!posted) {
			return absl::FailedPreconditionError("event bus is stopped");
		}
	}
	return absl::OkStatus();
}

void EventBus::Stop() {
	executor_.Stop();
}

} // namespace WaitingRoom
