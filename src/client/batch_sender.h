#ifndef FIREHOSE_CLIENT_BATCH_SENDER_H_
#define FIREHOSE_CLIENT_BATCH_SENDER_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "common/config.h"
#include "transport/connector.h"
#include "transport/transport_channel.h"

namespace Firehose {

struct BatchOutcome {
    enum class Status {
        kSent,              // every byte of the batch written
        kRetriesExhausted,  // socket stayed full for max_retries attempts
        kConnectionLost,    // peer closed and the reconnect failed (or was already used)
        kError              // any other write error
    };

    Status status = Status::kError;
    size_t bytes_written = 0;  // across all connections used for this batch
    int reconnects = 0;

    bool ok() const { return status == Status::kSent; }
};

/**
 * Writes one batch of `batch_size` identical units to a channel.
 *
 * Partial writes are continued from the remaining bytes. A would-block
 * counts as a retry and pauses for `retry_pause`; progress
 * resets the retry count. On connection loss the channel is replaced through
 * the Connector at most once per batch.
 */
class BatchSender {
public:
    BatchSender(size_t unit_size, size_t batch_size, Connector* connector,
            int max_retries = kMaxSendRetries,
            std::chrono::microseconds retry_pause = std::chrono::microseconds(kSendRetryPauseUs));

    /**
     * @param channel Current connection; replaced (or reset to null) on reconnect
     */
    BatchOutcome SendBatch(std::unique_ptr<TransportChannel>& channel);

    size_t batch_size() const { return batch_size_; }
    size_t batch_bytes() const { return batch_.size(); }

private:
    // Closes the old channel and runs one connect sequence
    bool Reconnect(std::unique_ptr<TransportChannel>& channel);

    size_t batch_size_;
    Connector* connector_;  // not owned; may be null (no reconnect)
    int max_retries_;
    std::chrono::microseconds retry_pause_;
    std::vector<uint8_t> batch_;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_BATCH_SENDER_H_
