#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

// Project includes
#include "admission/admission_recorder.h"
#include "common/clock.h"
#include "common/configuration.h"
#include "control_service.h"
#include "events/event_bus.h"
#include "events/event_publisher.h"
#include "reconciler/counter_advancer.h"
#include "reconciler/expiry_scanner.h"
#include "reconciler/reconcile_scheduler.h"
#include "reset/reset_controller.h"
#include "store/counter_store_adapter.h"
#include "store/memory_counter_store.h"
#include "store/memory_durable_index.h"
#include "store/write_gate.h"

namespace {

// Blocks SIGINT/SIGTERM in every thread spawned after this call so that only
// the waiter thread observes them
void BlockTerminationSignals(sigset_t* set) {
	sigemptyset(set);
	sigaddset(set, SIGINT);
	sigaddset(set, SIGTERM);
	pthread_sigmask(SIG_BLOCK, set, nullptr);
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("waitingroomd", "Virtual waiting room admission-control daemon");

	options.add_options()
		("c,config", "Path to the YAML configuration", cxxopts::value<std::string>())
		("listen", "gRPC listen address, overrides server.listen_address", cxxopts::value<std::string>())
		("no_scheduler", "Only reconcile on demand through the Reconcile RPC")
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	WaitingRoom::Configuration& configuration = WaitingRoom::Configuration::getInstance();
	bool loaded = arguments.count("config")
		? configuration.loadFromFile(arguments["config"].as<std::string>())
		: configuration.validate();
	if (!loaded) {
		for (const auto& error : configuration.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		LOG(ERROR) << "Invalid configuration, refusing to start";
		return EXIT_FAILURE;
	}
	const WaitingRoom::WaitingRoomConfig& config = configuration.config();

	std::string listen_address = arguments.count("listen")
		? arguments["listen"].as<std::string>()
		: config.server.listen_address.get();

	sigset_t termination_signals;
	BlockTerminationSignals(&termination_signals);

	// *************** Stores **********************
	WaitingRoom::DurableTableNames tables{
		config.tables.token_table.get(),
		config.tables.queue_position_entry_time_table.get(),
		config.tables.serving_counter_issued_at_table.get()};

	WaitingRoom::InMemoryCounterStore counter_store;
	WaitingRoom::InMemoryDurableIndex durable_index(tables);
	WaitingRoom::CounterStoreAdapter counters(counter_store);
	WaitingRoom::SystemClock clock;

	// *************** Notifications **********************
	WaitingRoom::LogEventPublisher log_publisher;
	WaitingRoom::EventBus event_bus;
	WaitingRoom::FanoutEventPublisher publisher;
	publisher.AddPublisher(&log_publisher);
	publisher.AddPublisher(&event_bus);

	WaitingRoom::EventTags tags{
		config.events.source.get(),
		config.events.detail_type.get(),
		config.events.event_bus_name.get()};

	// *************** Reconciliation and reset **********************
	const std::string event_id = configuration.getEventId();
	WaitingRoom::WriteGate write_gate;

	WaitingRoom::CounterAdvancer advancer(counters, durable_index, publisher, clock,
			WaitingRoom::AdvancerOptions{event_id, tags});
	WaitingRoom::ExpiryScanner scanner(counters, durable_index, advancer, clock, write_gate,
			WaitingRoom::ScannerOptions{event_id, configuration.getExpiryPeriodSeconds(),
			configuration.getIncrementOnExpiry()});

	WaitingRoom::ResetOptions reset_options;
	reset_options.event_id = event_id;
	reset_options.tables = tables;
	reset_options.waiter.poll_interval = std::chrono::milliseconds(config.reset.table_poll_interval_ms.get());
	reset_options.waiter.timeout = std::chrono::milliseconds(config.reset.table_wait_timeout_ms.get());
	reset_options.overall_timeout = std::chrono::milliseconds(config.reset.overall_timeout_ms.get());
	WaitingRoom::ResetController reset_controller(counters, durable_index, write_gate, reset_options);

	absl::Status recovered = reset_controller.Recover();
	if (!recovered.ok()) {
		LOG(ERROR) << "Reading reset_in_progress failed: " << recovered;
		return EXIT_FAILURE;
	}

	WaitingRoom::ReconcileScheduler scheduler(scanner,
			std::chrono::milliseconds(config.reconciler.interval_ms.get()));

	// *************** Control surface **********************
	WaitingRoom::AdmissionRecorder recorder(counters, durable_index, clock, write_gate, event_id);
	WaitingRoom::WaitingRoomControlServiceImpl service(scanner, reset_controller, recorder, counters, event_bus);

	grpc::ServerBuilder builder;
	builder.AddListeningPort(listen_address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);
	std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
	if (!server) {
		LOG(ERROR) << "Failed to start the control server on " << listen_address;
		return EXIT_FAILURE;
	}

	if (!arguments.count("no_scheduler")) {
		scheduler.Start();
	}
	LOG(INFO) << "waitingroomd serving event " << event_id << " on " << listen_address;

	std::thread signal_waiter([&termination_signals, &server]() {
			int signal = 0;
			sigwait(&termination_signals, &signal);
			LOG(INFO) << "Received signal " << signal << ", shutting down";
			server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
			});

	// *************** Wait unless there's a failure **********************
	server->Wait();
	signal_waiter.join();

	scheduler.Stop();
	event_bus.Stop();
	LOG(INFO) << "waitingroomd terminating";
	return EXIT_SUCCESS;
}
