#ifndef FIREHOSE_CLIENT_RUN_STATS_H_
#define FIREHOSE_CLIENT_RUN_STATS_H_

#include <chrono>
#include <cstdint>
#include <string>

#include "batch_sender.h"

namespace Firehose {

/**
 * Per-transmitter run counters. Written only by the owning pacing loop;
 * read by others after the loop has finished.
 */
struct ClientRunStats {
    uint64_t packets_sent = 0;
    uint64_t bytes_sent = 0;
    uint64_t errors = 0;
    uint64_t reconnects = 0;
    double avg_rate = 0.0;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;

    /**
     * Successful batches add batch_size packets and their bytes; failed
     * batches add batch_size errors and no bytes.
     */
    void Record(const BatchOutcome& outcome, size_t batch_size);

    // Sets end_time and avg_rate
    void Finalize(std::chrono::steady_clock::time_point now);

    double duration_seconds() const {
        return std::chrono::duration<double>(end_time - start_time).count();
    }

    /**
     * Machine-readable block parsed by the analysis tooling. Format is fixed.
     */
    std::string FormatFinal() const;

    // Human-readable completion report
    std::string FormatSummary(const std::string& client_id) const;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_RUN_STATS_H_
