#include "batch_sender.h"

#include <cstring>
#include <string>
#include <thread>

#include <glog/logging.h>

namespace Firehose {

namespace {
constexpr uint8_t kUnitFill = 'X';
} // end of namespace

BatchSender::BatchSender(size_t unit_size, size_t batch_size, Connector* connector,
        int max_retries, std::chrono::microseconds retry_pause)
    : batch_size_(batch_size),
      connector_(connector),
      max_retries_(max_retries),
      retry_pause_(retry_pause),
      batch_(unit_size * batch_size, kUnitFill) {}

bool BatchSender::Reconnect(std::unique_ptr<TransportChannel>& channel) {
    if (channel) {
        channel->Close();
        channel.reset();
    }
    if (connector_ == nullptr) {
        return false;
    }
    channel = connector_->Connect();
    return channel != nullptr;
}

BatchOutcome BatchSender::SendBatch(std::unique_ptr<TransportChannel>& channel) {
    BatchOutcome outcome;
    const size_t total = batch_.size();
    size_t offset = 0;
    int retry_count = 0;
    bool reconnect_used = false;

    // A previous batch left us without a connection
    if (!channel || !channel->is_open()) {
        reconnect_used = true;
        outcome.reconnects++;
        if (!Reconnect(channel)) {
            outcome.status = BatchOutcome::Status::kConnectionLost;
            return outcome;
        }
    }

    while (offset < total) {
        IoResult r = channel->Write(batch_.data() + offset, total - offset);

        switch (r.status) {
            case IoStatus::kOk:
                offset += r.bytes;
                outcome.bytes_written += r.bytes;
                retry_count = 0;
                break;

            case IoStatus::kWouldBlock:
                retry_count++;
                if (retry_count >= max_retries_) {
                    VLOG(2) << "Socket buffer full for " << retry_count << " attempts, "
                        << (total - offset) << " bytes unsent";
                    outcome.status = BatchOutcome::Status::kRetriesExhausted;
                    return outcome;
                }
                std::this_thread::sleep_for(retry_pause_);
                break;

            case IoStatus::kClosed:
                LOG(ERROR) << "Connection lost to " << channel->peer().ToString()
                    << (r.error ? std::string(": ") + strerror(r.error) : std::string());
                if (reconnect_used) {
                    channel->Close();
                    outcome.status = BatchOutcome::Status::kConnectionLost;
                    return outcome;
                }
                reconnect_used = true;
                outcome.reconnects++;
                if (!Reconnect(channel)) {
                    LOG(ERROR) << "Reconnect failed, dropping batch";
                    outcome.status = BatchOutcome::Status::kConnectionLost;
                    return outcome;
                }
                LOG(INFO) << "Reconnected successfully";
                retry_count = 0;
                break;

            case IoStatus::kError:
                LOG(ERROR) << "Send error: " << strerror(r.error);
                outcome.status = BatchOutcome::Status::kError;
                return outcome;
        }
    }

    outcome.status = BatchOutcome::Status::kSent;
    return outcome;
}

} // namespace Firehose
