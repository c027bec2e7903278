#include <pthread.h>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <iostream>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "ingestion_service.h"

namespace {

bool LoadConfiguration(const cxxopts::ParseResult& arguments) {
	Firehose::Configuration& config = Firehose::Configuration::getInstance();
	if (arguments.count("config")) {
		const std::string path = arguments["config"].as<std::string>();
		if (!config.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			return false;
		}
	}
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Configuration error: " << error;
		}
		return false;
	}
	return true;
}

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("firehose_ingest", "High-rate TCP ingestion service");

	options.add_options()
		("host", "Listen address", cxxopts::value<std::string>())
		("p,port", "Listen port", cxxopts::value<int>())
		("w,workers", "Number of worker threads (0: min(cores, max_clients))", cxxopts::value<int>())
		("m,max_clients", "Maximum simultaneous connections", cxxopts::value<int>())
		("config", "YAML configuration file", cxxopts::value<std::string>())
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	if (!LoadConfiguration(arguments)) {
		return EXIT_FAILURE;
	}

	Firehose::IngestOptions ingest = Firehose::IngestOptions::FromConfig();
	if (arguments.count("host")) {
		ingest.host = arguments["host"].as<std::string>();
	}
	if (arguments.count("port")) {
		ingest.port = arguments["port"].as<int>();
	}
	if (arguments.count("max_clients")) {
		ingest.max_clients = arguments["max_clients"].as<int>();
		ingest.handoff_capacity = 2 * static_cast<size_t>(std::max(1, ingest.max_clients));
	}
	if (arguments.count("workers")) {
		ingest.num_workers = arguments["workers"].as<int>();
	}
	if (!Firehose::IsValidPort(ingest.port, true)) {
		LOG(ERROR) << "Invalid port " << ingest.port << ": must be between 0 and 65535";
		return EXIT_FAILURE;
	}
	if (ingest.max_clients <= 0) {
		LOG(ERROR) << "max_clients must be positive";
		return EXIT_FAILURE;
	}

	const auto& client = Firehose::GetConfig().config().client;
	if (client.unit_size.get() != ingest.read.read_size) {
		LOG(WARNING) << "Read size " << ingest.read.read_size << " differs from client unit size "
			<< client.unit_size.get() << ": one received packet is one read, not one client unit";
	}

	// Block termination signals in every thread; the main thread takes them with sigwait
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
		LOG(ERROR) << "pthread_sigmask failed";
		return EXIT_FAILURE;
	}

	Firehose::IngestionService service(ingest);
	if (!service.Start()) {
		LOG(ERROR) << "Ingestion service failed to start";
		return EXIT_FAILURE;
	}
	LOG(INFO) << "Server listening on " << ingest.host << ":" << service.port();

	int sig = 0;
	if (sigwait(&signals, &sig) != 0) {
		LOG(ERROR) << "sigwait failed";
	} else {
		LOG(INFO) << "Received " << strsignal(sig) << ", stopping";
	}

	service.Stop();
	return EXIT_SUCCESS;
}
