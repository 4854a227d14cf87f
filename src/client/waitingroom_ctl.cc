#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>
#include <waitingroom.grpc.pb.h>

#include "common/counters.h"

using waitingroom_control::WaitingRoomControl;

namespace {

int RunReconcile(WaitingRoomControl::Stub& stub) {
	grpc::ClientContext context;
	waitingroom_control::ReconcileRequest request;
	waitingroom_control::ReconcileResponse reply;
	grpc::Status status = stub.Reconcile(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "Reconcile failed: " << status.error_message();
		return EXIT_FAILURE;
	}
	std::cout << "outcome: " << waitingroom_control::ReconcileResponse::Outcome_Name(reply.outcome()) << "\n"
		<< "max_queue_position_expired: " << reply.watermark_before() << " -> " << reply.watermark_after() << "\n"
		<< "positions_expired: " << reply.positions_expired() << "\n"
		<< "serving_counter_increments: " << reply.serving_counter_increments() << std::endl;
	return EXIT_SUCCESS;
}

int RunReset(WaitingRoomControl::Stub& stub, const std::string& event_id) {
	grpc::ClientContext context;
	waitingroom_control::ResetRequest request;
	waitingroom_control::ResetResponse reply;
	request.set_event_id(event_id);
	grpc::Status status = stub.Reset(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "Reset failed (" << status.error_code() << "): " << status.error_message();
		return EXIT_FAILURE;
	}
	std::cout << reply.status_code() << " "
		<< (reply.status_code() == 200 ? reply.message() : reply.error()) << std::endl;
	return reply.status_code() == 200 ? EXIT_SUCCESS : EXIT_FAILURE;
}

int RunEnqueue(WaitingRoomControl::Stub& stub, const std::string& request_id) {
	grpc::ClientContext context;
	waitingroom_control::AssignQueuePositionRequest request;
	waitingroom_control::AssignQueuePositionResponse reply;
	request.set_request_id(request_id);
	grpc::Status status = stub.AssignQueuePosition(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "AssignQueuePosition failed (" << status.error_code() << "): " << status.error_message();
		return EXIT_FAILURE;
	}
	std::cout << "queue_position: " << reply.queue_position() << "\n"
		<< "entry_time: " << reply.entry_time() << std::endl;
	return EXIT_SUCCESS;
}

int RunServe(WaitingRoomControl::Stub& stub, int64_t increment_by, int64_t served) {
	grpc::ClientContext context;
	waitingroom_control::IncrementServingCounterRequest request;
	waitingroom_control::IncrementServingCounterResponse reply;
	request.set_increment_by(increment_by);
	request.set_queue_positions_served(served);
	grpc::Status status = stub.IncrementServingCounter(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "IncrementServingCounter failed (" << status.error_code() << "): " << status.error_message();
		return EXIT_FAILURE;
	}
	std::cout << "serving_counter: " << reply.serving_counter() << "\n"
		<< "issue_time: " << reply.issue_time() << std::endl;
	return EXIT_SUCCESS;
}

int RunCounters(WaitingRoomControl::Stub& stub, const std::string& key) {
	if (!key.empty() && !WaitingRoom::ParseCounterKey(key).has_value()) {
		LOG(ERROR) << "Unknown counter " << key;
		return EXIT_FAILURE;
	}

	grpc::ClientContext context;
	waitingroom_control::GetCountersRequest request;
	waitingroom_control::GetCountersResponse reply;
	grpc::Status status = stub.GetCounters(&context, request, &reply);
	if (!status.ok()) {
		LOG(ERROR) << "GetCounters failed: " << status.error_message();
		return EXIT_FAILURE;
	}

	if (!key.empty()) {
		auto it = reply.counters().find(key);
		std::cout << key << ": " << (it == reply.counters().end() ? 0 : it->second) << std::endl;
		return EXIT_SUCCESS;
	}
	// Catalogue order rather than map order
	for (WaitingRoom::CounterKey counter : WaitingRoom::kAllCounterKeys) {
		std::string name(WaitingRoom::CounterKeyName(counter));
		auto it = reply.counters().find(name);
		std::cout << name << ": " << (it == reply.counters().end() ? 0 : it->second) << "\n";
	}
	std::cout << "controller_state: " << reply.controller_state() << std::endl;
	return EXIT_SUCCESS;
}

int RunWatch(WaitingRoomControl::Stub& stub) {
	grpc::ClientContext context;
	waitingroom_control::SubscribeEventsRequest request;
	std::unique_ptr<grpc::ClientReader<waitingroom_control::EventEnvelope>> reader(
			stub.SubscribeEvents(&context, request));

	waitingroom_control::EventEnvelope event;
	while (reader->Read(&event)) {
		std::cout << event.time() << " " << event.source() << " " << event.detail_type()
			<< " " << event.detail() << std::endl;
	}
	grpc::Status status = reader->Finish();
	if (!status.ok()) {
		LOG(ERROR) << "Event stream closed: " << status.error_message();
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

} // end of namespace

int main(int argc, char* argv[]) {
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("waitingroom_ctl", "Control client for waitingroomd");

	options.add_options()
		("s,server", "waitingroomd address", cxxopts::value<std::string>()->default_value("127.0.0.1:50061"))
		("e,event_id", "Event id to reset", cxxopts::value<std::string>()->default_value(""))
		("k,key", "Single counter to print", cxxopts::value<std::string>()->default_value(""))
		("r,request_id", "Request to enqueue", cxxopts::value<std::string>()->default_value(""))
		("n,increment_by", "Positions to let through", cxxopts::value<int64_t>()->default_value("1"))
		("served", "Positions of that range already served", cxxopts::value<int64_t>()->default_value("0"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
		("command", "reconcile | reset | counters | watch | enqueue | serve", cxxopts::value<std::string>())
		("h,help", "Print usage");
	options.parse_positional({"command"});
	options.positional_help("<command>");

	auto result = options.parse(argc, argv);
	FLAGS_v = result["log_level"].as<int>();

	if (result.count("help") || !result.count("command")) {
		std::cout << options.help() << std::endl;
		return result.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	std::unique_ptr<WaitingRoomControl::Stub> stub = WaitingRoomControl::NewStub(
			grpc::CreateChannel(result["server"].as<std::string>(), grpc::InsecureChannelCredentials()));

	const std::string command = result["command"].as<std::string>();
	if (command == "reconcile") {
		return RunReconcile(*stub);
	} else if (command == "reset") {
		return RunReset(*stub, result["event_id"].as<std::string>());
	} else if (command == "counters") {
		return RunCounters(*stub, result["key"].as<std::string>());
	} else if (command == "watch") {
		return RunWatch(*stub);
	} else if (command == "enqueue") {
		return RunEnqueue(*stub, result["request_id"].as<std::string>());
	} else if (command == "serve") {
		return RunServe(*stub, result["increment_by"].as<int64_t>(), result["served"].as<int64_t>());
	}

	LOG(ERROR) << "Unknown command " << command;
	std::cout << options.help() << std::endl;
	return EXIT_FAILURE;
}
