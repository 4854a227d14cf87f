#include "control_service.h"

#include <memory>
#include <string>

#include <glog/logging.h>

#include "absl/cleanup/cleanup.h"
#include "absl/time/time.h"
#include "common/errors.h"
#include "stream_queue.h"

namespace WaitingRoom {

namespace {

ReconcileResponse::Outcome ToProtoOutcome(ScanReport::Outcome outcome) {
	switch (outcome) {
		case ScanReport::Outcome::RESET_IN_PROGRESS:    return ReconcileResponse::RESET_IN_PROGRESS;
		case ScanReport::Outcome::NOTHING_ELIGIBLE:     return ReconcileResponse::NOTHING_ELIGIBLE;
		case ScanReport::Outcome::QUEUE_POSITION_GAP:   return ReconcileResponse::QUEUE_POSITION_GAP;
		case ScanReport::Outcome::WITHIN_GRACE_PERIOD:  return ReconcileResponse::WITHIN_GRACE_PERIOD;
		case ScanReport::Outcome::CANDIDATES_EXHAUSTED: return ReconcileResponse::CANDIDATES_EXHAUSTED;
	}
	return ReconcileResponse::NOTHING_ELIGIBLE;
}

// Events buffered per stream before the oldest are dropped
constexpr size_t kMaxPendingStreamEvents = 1024;

} // namespace

Status WaitingRoomControlServiceImpl::Reconcile(ServerContext* context,
		const ReconcileRequest* request, ReconcileResponse* reply) {
	auto report = scanner_.ReconcileExpiredPositions();
	if (!report.ok()) {
		return ToGrpcStatus(report.status());
	}
	reply->set_outcome(ToProtoOutcome(report->outcome));
	reply->set_watermark_before(report->watermark_before);
	reply->set_watermark_after(report->watermark_after);
	reply->set_positions_expired(report->positions_expired);
	reply->set_serving_counter_increments(report->serving_counter_increments);
	return Status::OK;
}

Status WaitingRoomControlServiceImpl::Reset(ServerContext* context,
		const ResetRequest* request, ResetResponse* reply) {
	LOG(INFO) << "[WaitingRoomControl] Reset requested for event " << request->event_id();
	auto result = reset_controller_.Reset(request->event_id());
	if (!result.ok()) {
		return ToGrpcStatus(result.status());
	}
	reply->set_status_code(result->status_code);
	reply->set_message(result->message);
	reply->set_error(result->error);
	return Status::OK;
}

Status WaitingRoomControlServiceImpl::GetCounters(ServerContext* context,
		const GetCountersRequest* request, GetCountersResponse* reply) {
	auto snapshot = counters_.ReadAll();
	if (!snapshot.ok()) {
		return ToGrpcStatus(snapshot.status());
	}
	auto* counters = reply->mutable_counters();
	for (const auto& [key, value] : *snapshot) {
		(*counters)[std::string(CounterKeyName(key))] = value;
	}
	reply->set_controller_state(ControllerStateName(reset_controller_.state()));
	return Status::OK;
}

Status WaitingRoomControlServiceImpl::SubscribeEvents(ServerContext* context,
		const SubscribeEventsRequest* request, ServerWriter<EventEnvelope>* writer) {
	auto queue = std::make_shared<StreamQueue>(kMaxPendingStreamEvents);
	EventBus::SubscriptionId id = event_bus_.Subscribe([queue](const EventEnvelope& event) {
			queue->Push(event);
			});
	auto unsubscribe = absl::MakeCleanup([this, id]() { event_bus_.Unsubscribe(id); });
	VLOG(1) << "[WaitingRoomControl] Event subscriber " << id << " attached";

	EventEnvelope event;
	while (!context->IsCancelled()) {
		if (!queue->Pop(&event, absl::Milliseconds(100))) {
			continue;
		}
		if (!writer->Write(event)) {
			VLOG(1) << "[WaitingRoomControl] Event subscriber " << id << " went away";
			break;
		}
	}
	return Status::OK;
}

Status WaitingRoomControlServiceImpl::AssignQueuePosition(ServerContext* context,
		const AssignQueuePositionRequest* request, AssignQueuePositionResponse* reply) {
	auto entry = recorder_.AssignQueuePosition(request->request_id());
	if (!entry.ok()) {
		return ToGrpcStatus(entry.status());
	}
	reply->set_queue_position(entry->queue_position);
	reply->set_entry_time(entry->entry_time);
	return Status::OK;
}

Status WaitingRoomControlServiceImpl::IncrementServingCounter(ServerContext* context,
		const IncrementServingCounterRequest* request, IncrementServingCounterResponse* reply) {
	auto issuance = recorder_.IncrementServingCounter(request->increment_by(),
			request->queue_positions_served());
	if (!issuance.ok()) {
		return ToGrpcStatus(issuance.status());
	}
	reply->set_serving_counter(issuance->serving_counter);
	reply->set_issue_time(issuance->issue_time);
	return Status::OK;
}

} // namespace WaitingRoom
