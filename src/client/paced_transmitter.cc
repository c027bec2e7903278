#include "paced_transmitter.h"

#include <sstream>

#include <glog/logging.h>

#include "common/configuration.h"
#include "send_pacer.h"

namespace Firehose {

TransmitterOptions TransmitterOptions::FromConfig() {
    const auto& config = GetConfig().config();
    const auto& client = config.client;

    TransmitterOptions options;
    options.host = client.host.get();
    options.port = static_cast<uint16_t>(client.port.get());
    options.target_rate = client.target_rate.get();
    options.unit_size = client.unit_size.get();
    options.batch_size = client.batch_size.get();
    options.max_send_retries = client.max_send_retries.get();
    options.send_retry_pause = std::chrono::microseconds(client.send_retry_pause_us.get());
    options.stop_timeout = std::chrono::milliseconds(client.stop_timeout_ms.get());
    options.socket_buffer_bytes = config.ingest.socket_buffer_bytes.get();
    options.retry = RetryPolicy::FromConfig();
    return options;
}

PacedTransmitter::PacedTransmitter(std::string client_id, TransmitterOptions options)
    : client_id_(std::move(client_id)),
      options_(std::move(options)),
      connector_(std::make_unique<TcpConnector>(options_.host, options_.port, options_.retry,
                  stop_.token(), options_.socket_buffer_bytes)),
      sender_(options_.unit_size, options_.batch_size, connector_.get(),
              options_.max_send_retries, options_.send_retry_pause),
      done_future_(done_.get_future()) {}

PacedTransmitter::PacedTransmitter(std::string client_id, TransmitterOptions options,
        std::unique_ptr<Connector> connector)
    : client_id_(std::move(client_id)),
      options_(std::move(options)),
      connector_(std::move(connector)),
      sender_(options_.unit_size, options_.batch_size, connector_.get(),
              options_.max_send_retries, options_.send_retry_pause),
      done_future_(done_.get_future()) {}

PacedTransmitter::~PacedTransmitter() {
    Stop();
}

bool PacedTransmitter::Connect() {
    if (!connector_) {
        LOG(ERROR) << "Client " << client_id_ << " has no connector";
        return false;
    }
    channel_ = connector_->Connect();
    if (!channel_) {
        LOG(ERROR) << "Client " << client_id_ << " failed to connect to " << connector_->target();
        return false;
    }
    return true;
}

bool PacedTransmitter::Start(std::chrono::duration<double> duration) {
    if (!channel_) {
        LOG(ERROR) << "Not connected to server";
        return false;
    }
    if (started_) {
        LOG(WARNING) << "Client " << client_id_ << " already started";
        return false;
    }
    started_ = true;

    auto now = std::chrono::steady_clock::now();
    stats_.start_time = now;
    auto end_time = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration);

    thread_ = std::thread([this, end_time]() {
        try {
            TransmissionLoop(end_time);
        } catch (const std::exception& e) {
            LOG(ERROR) << "Client " << client_id_ << " transmission loop failed: " << e.what();
        }
        done_.set_value();
    });

    LOG(INFO) << "Client " << client_id_ << " starting transmission at " << options_.target_rate
        << " Hz for " << duration.count() << "s";
    return true;
}

//----------------------------------------------------------------------------
// Pacing loop
//----------------------------------------------------------------------------

void PacedTransmitter::TransmissionLoop(std::chrono::steady_clock::time_point end_time) {
    StopToken stop = stop_.token();
    SendPacer pacer(options_.target_rate, options_.batch_size, stats_.start_time);

    while (!stop.stop_requested() && std::chrono::steady_clock::now() < end_time) {
        auto now = std::chrono::steady_clock::now();

        if (pacer.Due(now)) {
            SendOne();
            pacer.Advance();
        }

        if (stop.WaitFor(pacer.SleepFor(now))) {
            break;
        }
    }

    stats_.Finalize(std::chrono::steady_clock::now());
    LogFinalStats();
}

void PacedTransmitter::SendOne() {
    try {
        BatchOutcome outcome = sender_.SendBatch(channel_);
        stats_.Record(outcome, options_.batch_size);
    } catch (const std::exception& e) {
        uint64_t before = stats_.errors;
        stats_.errors += options_.batch_size;
        if (before / kErrorLogEvery != stats_.errors / kErrorLogEvery) {
            LOG(ERROR) << "Batch send error: " << e.what();
        }
    }
}

void PacedTransmitter::LogFinalStats() const {
    std::string line;
    std::istringstream summary(stats_.FormatSummary(client_id_));
    while (std::getline(summary, line)) {
        LOG(INFO) << line;
    }
    std::istringstream final_block(stats_.FormatFinal());
    while (std::getline(final_block, line)) {
        LOG(INFO) << line;
    }
}

//----------------------------------------------------------------------------
// Lifecycle
//----------------------------------------------------------------------------

void PacedTransmitter::Wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool PacedTransmitter::finished() const {
    if (!started_) {
        return false;
    }
    return done_future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PacedTransmitter::Stop() {
    stop_.RequestStop();

    if (thread_.joinable()) {
        if (done_future_.wait_for(options_.stop_timeout) != std::future_status::ready) {
            LOG(WARNING) << "Client " << client_id_ << " did not stop within "
                << options_.stop_timeout.count() << "ms";
        }
        thread_.join();
    }

    if (channel_) {
        channel_->Close();
        channel_.reset();
    }
}

} // namespace Firehose
