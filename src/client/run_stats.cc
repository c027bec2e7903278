#include "run_stats.h"

#include <iomanip>
#include <sstream>

namespace Firehose {

void ClientRunStats::Record(const BatchOutcome& outcome, size_t batch_size) {
    reconnects += outcome.reconnects;
    if (outcome.ok()) {
        packets_sent += batch_size;
        bytes_sent += outcome.bytes_written;
    } else {
        errors += batch_size;
    }
}

void ClientRunStats::Finalize(std::chrono::steady_clock::time_point now) {
    end_time = now;
    double duration = duration_seconds();
    if (duration > 0) {
        avg_rate = static_cast<double>(packets_sent) / duration;
    }
}

std::string ClientRunStats::FormatFinal() const {
    std::ostringstream out;
    out << "=== CLIENT FINAL STATISTICS ===\n"
        << "Total packets sent: " << packets_sent << "\n"
        << "Total bytes sent: " << bytes_sent << "\n"
        << std::fixed << std::setprecision(2)
        << "Duration: " << duration_seconds() << "s\n"
        << std::setprecision(1)
        << "Average rate: " << avg_rate << "Hz\n"
        << "Errors: " << errors << "\n"
        << "=== END CLIENT STATISTICS ===";
    return out.str();
}

std::string ClientRunStats::FormatSummary(const std::string& client_id) const {
    std::ostringstream out;
    out << "Client " << client_id << " transmission completed:\n"
        << "  Packets sent: " << packets_sent << "\n"
        << "  Bytes sent: " << bytes_sent << "\n"
        << std::fixed << std::setprecision(2)
        << "  Duration: " << duration_seconds() << "s\n"
        << std::setprecision(1)
        << "  Average rate: " << avg_rate << " Hz\n"
        << "  Errors: " << errors << "\n"
        << "  Reconnects: " << reconnects;
    return out.str();
}

} // namespace Firehose
