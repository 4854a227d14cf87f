#ifndef WAITINGROOM_SERVER_CONTROL_SERVICE_H_
#define WAITINGROOM_SERVER_CONTROL_SERVICE_H_

#include <grpcpp/grpcpp.h>
#include <waitingroom.grpc.pb.h>

#include "admission/admission_recorder.h"
#include "events/event_bus.h"
#include "reconciler/expiry_scanner.h"
#include "reset/reset_controller.h"
#include "store/counter_store_adapter.h"

namespace WaitingRoom {

using grpc::ServerContext;
using grpc::ServerWriter;
using grpc::Status;
using waitingroom_control::WaitingRoomControl;
using waitingroom_control::ReconcileRequest;
using waitingroom_control::ReconcileResponse;
using waitingroom_control::ResetRequest;
using waitingroom_control::ResetResponse;
using waitingroom_control::GetCountersRequest;
using waitingroom_control::GetCountersResponse;
using waitingroom_control::SubscribeEventsRequest;
using waitingroom_control::AssignQueuePositionRequest;
using waitingroom_control::AssignQueuePositionResponse;
using waitingroom_control::IncrementServingCounterRequest;
using waitingroom_control::IncrementServingCounterResponse;

/**
 * Operator surface of the admission-control core: on-demand reconciliation,
 * reset trigger, counter snapshot and a stream of serving counter notifications.
 * The queueing front end records queue positions and serving counter moves through it.
 */
class WaitingRoomControlServiceImpl final : public WaitingRoomControl::Service {
	public:
		WaitingRoomControlServiceImpl(ExpiryScanner& scanner, ResetController& reset_controller,
				AdmissionRecorder& recorder, CounterStoreAdapter& counters, EventBus& event_bus)
			: scanner_(scanner),
			  reset_controller_(reset_controller),
			  recorder_(recorder),
			  counters_(counters),
			  event_bus_(event_bus) {}

		Status Reconcile(ServerContext* context, const ReconcileRequest* request,
				ReconcileResponse* reply) override;

		Status Reset(ServerContext* context, const ResetRequest* request,
				ResetResponse* reply) override;

		Status GetCounters(ServerContext* context, const GetCountersRequest* request,
				GetCountersResponse* reply) override;

		/// Blocks until the client cancels, forwarding every published event
		Status SubscribeEvents(ServerContext* context, const SubscribeEventsRequest* request,
				ServerWriter<EventEnvelope>* writer) override;

		Status AssignQueuePosition(ServerContext* context, const AssignQueuePositionRequest* request,
				AssignQueuePositionResponse* reply) override;

		Status IncrementServingCounter(ServerContext* context, const IncrementServingCounterRequest* request,
				IncrementServingCounterResponse* reply) override;

	private:
		ExpiryScanner& scanner_;
		ResetController& reset_controller_;
		AdmissionRecorder& recorder_;
		CounterStoreAdapter& counters_;
		EventBus& event_bus_;
};

} // namespace WaitingRoom

#endif // WAITINGROOM_SERVER_CONTROL_SERVICE_H_
