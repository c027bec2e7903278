#include <pthread.h>
#include <signal.h>
#include <time.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "result_writer.h"
#include "simulator.h"

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
    FLAGS_logtostderr = 1; // log only to console, no files.

    // Setup command line options
    cxxopts::Options options("firehose_client", "Paced multi-connection traffic generator");

    options.add_options()
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
        ("host", "Server host", cxxopts::value<std::string>())
        ("p,port", "Server port", cxxopts::value<int>())
        ("c,clients", "Number of clients", cxxopts::value<int>())
        ("r,rate", "Target rate per client (Hz)", cxxopts::value<double>())
        ("d,duration", "Test duration (seconds)", cxxopts::value<double>())
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("record_results", "Record Results in a csv file")
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return EXIT_SUCCESS;
    }

    FLAGS_v = result["log_level"].as<int>();

    if (!LoadConfiguration(result)) {
        return EXIT_FAILURE;
    }
    const auto& config = Firehose::GetConfig().config();

    // Container start ordering: give the service time to come up
    int startup_delay = config.client.startup_delay_s.get();
    if (startup_delay > 0) {
        LOG(INFO) << "Client startup delay: " << startup_delay << " seconds";
        std::this_thread::sleep_for(std::chrono::seconds(startup_delay));
    }

    // Extract parameters
    Firehose::TransmitterOptions transmitter = Firehose::TransmitterOptions::FromConfig();
    if (result.count("host")) {
        transmitter.host = result["host"].as<std::string>();
    }
    if (result.count("port")) {
        int port = result["port"].as<int>();
        if (!Firehose::IsValidPort(port, false)) {
            LOG(ERROR) << "Invalid port " << port << ": must be between 1 and 65535";
            return EXIT_FAILURE;
        }
        transmitter.port = static_cast<uint16_t>(port);
    }
    if (result.count("rate")) {
        transmitter.target_rate = result["rate"].as<double>();
    }
    int num_clients = result.count("clients") ? result["clients"].as<int>()
                                              : config.client.num_clients.get();
    double duration = result.count("duration") ? result["duration"].as<double>()
                                               : config.client.duration_s.get();

    if (num_clients <= 0 || transmitter.target_rate <= 0 || duration <= 0) {
        LOG(ERROR) << "clients, rate and duration must be positive";
        return EXIT_FAILURE;
    }

    Firehose::RunParameters params;
    params.num_clients = num_clients;
    params.target_rate = transmitter.target_rate;
    params.duration_s = duration;
    params.unit_size = transmitter.unit_size;
    params.batch_size = transmitter.batch_size;
    Firehose::ResultWriter writer(params,
            result.count("record_results") > 0 || config.results.record.get(),
            config.results.dir.get());

    // Block termination signals in every thread; the watcher below takes them
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        LOG(ERROR) << "pthread_sigmask failed";
        return EXIT_FAILURE;
    }

    Firehose::Simulator simulator(num_clients, transmitter);

    // Runs from before the first connect so a refused server cannot make the
    // client deaf to Ctrl-C during connect backoff
    Firehose::StopSource run_over;
    std::atomic<bool> interrupted{false};
    std::thread signal_watcher([&signals, &simulator, &interrupted, done = run_over.token()]() {
        struct timespec poll_interval;
        poll_interval.tv_sec = 0;
        poll_interval.tv_nsec = 100 * 1000 * 1000;

        while (!done.stop_requested()) {
            int sig = sigtimedwait(&signals, nullptr, &poll_interval);
            if (sig > 0) {
                LOG(INFO) << "Received " << strsignal(sig) << ", stopping clients";
                interrupted.store(true);
                simulator.RequestStop();
                return;
            }
            if (errno != EAGAIN && errno != EINTR) {
                LOG(ERROR) << "sigtimedwait failed: " << strerror(errno);
                return;
            }
        }
    });

    bool started = simulator.StartClients(std::chrono::duration<double>(duration));
    if (started) {
        simulator.WaitForCompletion();
    }
    run_over.RequestStop();
    signal_watcher.join();
    simulator.StopAll();

    if (!started && !interrupted.load()) {
        LOG(ERROR) << "Client simulator failed to start";
        return EXIT_FAILURE;
    }

    simulator.LogSummary();
    if (started) {
        writer.SetSummary(simulator.GetSummaryStats());
    }
    return EXIT_SUCCESS;
}
