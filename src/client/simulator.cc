#include "simulator.h"

#include <cstdio>
#include <iomanip>

#include <glog/logging.h>

namespace Firehose {

Simulator::Simulator(int num_clients, TransmitterOptions options, ConnectorFactory factory)
    : num_clients_(num_clients),
      options_(std::move(options)),
      factory_(std::move(factory)) {}

Simulator::~Simulator() {
    StopAll();
}

std::string Simulator::ClientId(int index) {
    char buf[32];
    snprintf(buf, sizeof(buf), "client_%03d", index);
    return std::string(buf);
}

bool Simulator::StartClients(std::chrono::duration<double> duration) {
    LOG(INFO) << "Starting " << num_clients_ << " clients";
    LOG(INFO) << "Target rate: " << options_.target_rate << " Hz per client";
    LOG(INFO) << "Total target rate: " << options_.target_rate * num_clients_ << " Hz";

    {
        absl::MutexLock lock(&mu_);
        for (int i = 0; i < num_clients_; i++) {
            std::string client_id = ClientId(i);
            if (factory_) {
                transmitters_.emplace_back(
                        std::make_unique<PacedTransmitter>(client_id, options_, factory_(client_id)));
            } else {
                transmitters_.emplace_back(std::make_unique<PacedTransmitter>(client_id, options_));
            }
        }
    }

    for (auto& client : transmitters_) {
        if (stop_.stop_requested()) {
            break;
        }
        if (client->Connect()) {
            LOG(INFO) << "Client " << client->id() << " connected";
            clients_.push_back(client.get());
        } else {
            LOG(ERROR) << "Client " << client->id() << " connection failed";
        }
    }

    if (stop_.stop_requested()) {
        LOG(WARNING) << "Stop requested during connect, " << clients_.size() << "/"
            << num_clients_ << " clients connected, none started";
        return false;
    }

    if (clients_.empty()) {
        LOG(ERROR) << "No clients connected";
        return false;
    }

    for (auto& client : clients_) {
        client->Start(duration);
    }

    LOG(INFO) << "All clients started (" << clients_.size() << "/" << num_clients_ << ")";
    return true;
}

void Simulator::WaitForCompletion() {
    for (auto& client : clients_) {
        client->Wait();
    }
}

bool Simulator::Done() const {
    for (const auto& client : clients_) {
        if (!client->finished()) {
            return false;
        }
    }
    return true;
}

void Simulator::RequestStop() {
    stop_.RequestStop();
    absl::MutexLock lock(&mu_);
    for (auto& client : transmitters_) {
        client->RequestStop();
    }
}

void Simulator::StopAll() {
    for (auto& client : clients_) {
        client->Stop();
    }
}

SummaryStats Simulator::GetSummaryStats() const {
    SummaryStats summary;
    if (clients_.empty()) {
        return summary;
    }

    double rate_sum = 0.0;
    for (const auto& client : clients_) {
        const ClientRunStats& stats = client->stats();
        summary.total_packets += stats.packets_sent;
        summary.total_bytes += stats.bytes_sent;
        summary.total_errors += stats.errors;
        rate_sum += stats.avg_rate;
    }
    summary.total_clients = clients_.size();
    summary.avg_rate_per_client = rate_sum / static_cast<double>(clients_.size());
    summary.total_rate = summary.avg_rate_per_client * static_cast<double>(clients_.size());
    return summary;
}

void Simulator::LogSummary() const {
    SummaryStats s = GetSummaryStats();
    LOG(INFO) << "=== CLIENT SUMMARY ===";
    LOG(INFO) << "total_clients: " << s.total_clients;
    LOG(INFO) << "total_packets: " << s.total_packets;
    LOG(INFO) << "total_bytes: " << s.total_bytes;
    LOG(INFO) << "total_errors: " << s.total_errors;
    LOG(INFO) << "avg_rate_per_client: " << std::fixed << std::setprecision(1) << s.avg_rate_per_client;
    LOG(INFO) << "total_rate: " << std::fixed << std::setprecision(1) << s.total_rate;
}

} // namespace Firehose
