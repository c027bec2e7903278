#ifndef FIREHOSE_CLIENT_PACED_TRANSMITTER_H_
#define FIREHOSE_CLIENT_PACED_TRANSMITTER_H_

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "common/cancellation.h"
#include "common/config.h"
#include "transport/connector.h"
#include "batch_sender.h"
#include "run_stats.h"

namespace Firehose {

struct TransmitterOptions {
    std::string host = "localhost";
    uint16_t port = kDefaultPort;
    double target_rate = kDefaultTargetRate;
    size_t unit_size = kUnitSize;
    size_t batch_size = kBatchSize;
    int max_send_retries = kMaxSendRetries;
    std::chrono::microseconds send_retry_pause{kSendRetryPauseUs};
    std::chrono::milliseconds stop_timeout{kTransmitterStopTimeoutMs};
    int socket_buffer_bytes = kSocketBufferBytes;
    RetryPolicy retry;

    // Built from Configuration client.* and ingest.socket_buffer_bytes
    static TransmitterOptions FromConfig();
};

/**
 * One simulated connection: a pacing loop on its own thread sending batches
 * at target_rate units/sec until the run duration elapses or Stop() is called.
 */
class PacedTransmitter {
public:
    PacedTransmitter(std::string client_id, TransmitterOptions options);

    /**
     * Uses `connector` instead of a TCP connector to options.host:port.
     */
    PacedTransmitter(std::string client_id, TransmitterOptions options,
            std::unique_ptr<Connector> connector);

    ~PacedTransmitter();

    /**
     * Runs the connect sequence.
     * @return false when every attempt failed or a fatal error occurred
     */
    bool Connect();

    /**
     * Starts the pacing loop. Requires a successful Connect().
     */
    bool Start(std::chrono::duration<double> duration);

    // Blocks until the pacing loop has finished
    void Wait();

    /**
     * Cancels the loop, waits for it (bounded by stop_timeout, then
     * unbounded), and closes the connection. Idempotent.
     */
    void Stop();

    // Non-blocking; wakes a pending connect backoff or the pacing loop.
    void RequestStop() { stop_.RequestStop(); }

    bool finished() const;
    const std::string& id() const { return client_id_; }

    // Valid once finished()
    const ClientRunStats& stats() const { return stats_; }

private:
    void TransmissionLoop(std::chrono::steady_clock::time_point end_time);
    void SendOne();
    void LogFinalStats() const;

    std::string client_id_;
    TransmitterOptions options_;
    StopSource stop_;
    std::unique_ptr<Connector> connector_;
    BatchSender sender_;

    std::unique_ptr<TransportChannel> channel_;
    ClientRunStats stats_;

    std::thread thread_;
    std::promise<void> done_;
    std::future<void> done_future_;
    bool started_ = false;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_PACED_TRANSMITTER_H_
