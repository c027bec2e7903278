#ifndef FIREHOSE_CLIENT_SIMULATOR_H_
#define FIREHOSE_CLIENT_SIMULATOR_H_

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "paced_transmitter.h"

namespace Firehose {

struct SummaryStats {
    size_t total_clients = 0;
    uint64_t total_packets = 0;
    uint64_t total_bytes = 0;
    uint64_t total_errors = 0;
    double avg_rate_per_client = 0.0;
    double total_rate = 0.0;  // avg_rate_per_client * total_clients
};

/**
 * Runs a fixed number of Paced Transmitters against one target.
 */
class Simulator {
public:
    // Builds the connector for a client; null uses TCP to options.host:port
    using ConnectorFactory = std::function<std::unique_ptr<Connector>(const std::string& client_id)>;

    Simulator(int num_clients, TransmitterOptions options, ConnectorFactory factory = nullptr);
    ~Simulator();

    /**
     * Connects every client (dropping those that fail) and starts the
     * survivors.
     * @return false if no client connected or RequestStop() came first
     */
    bool StartClients(std::chrono::duration<double> duration);

    /**
     * Cancels pending connects and running loops without waiting for them.
     * Callable from any thread, including while StartClients() runs.
     */
    void RequestStop();
    bool stop_requested() const { return stop_.stop_requested(); }

    void WaitForCompletion();

    // True once every started client has finished its run
    bool Done() const;

    void StopAll();

    SummaryStats GetSummaryStats() const;
    void LogSummary() const;

    size_t connected_clients() const { return clients_.size(); }

    static std::string ClientId(int index);

private:
    int num_clients_;
    TransmitterOptions options_;
    ConnectorFactory factory_;
    StopSource stop_;

    // Filled once under mu_ at the start of StartClients(), never resized after
    absl::Mutex mu_;
    std::vector<std::unique_ptr<PacedTransmitter>> transmitters_;

    // Connected subset of transmitters_
    std::vector<PacedTransmitter*> clients_;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_SIMULATOR_H_
