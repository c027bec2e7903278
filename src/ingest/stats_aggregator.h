#ifndef FIREHOSE_INGEST_STATS_AGGREGATOR_H_
#define FIREHOSE_INGEST_STATS_AGGREGATOR_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"

#include "common/cancellation.h"
#include "common/config.h"
#include "stats_channel.h"

namespace Firehose {

/**
 * Running totals built from cumulative per-connection reports.
 * Only positive deltas against the previous report for the same
 * (worker_id, connection_id) are added. A connection's first report
 * counts in full.
 */
class AggregateTotals {
public:
	/**
	 * @return true if the report advanced the totals
	 */
	bool Apply(const StatsReport& report);

	uint64_t total_packets() const { return total_packets_; }
	uint64_t total_bytes() const { return total_bytes_; }
	size_t tracked_connections() const { return prev_.size(); }

private:
	using Key = std::pair<int, std::string>;

	absl::flat_hash_map<Key, StatsReport> prev_;
	uint64_t total_packets_ = 0;
	uint64_t total_bytes_ = 0;
};

struct AggregateSnapshot {
	uint64_t total_packets = 0;
	uint64_t total_bytes = 0;
	uint64_t reports = 0;
};

/**
 * Single consumer of the stats channel.
 */
class StatsAggregator {
public:
	StatsAggregator(StatsChannel& channel, StopToken stop,
			std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(kQueuePollMs));

	/**
	 * Thread body. Drains reports until stop is requested, then empties the
	 * channel and logs the final totals.
	 */
	void Run();

	/**
	 * Applies one report and logs the running totals.
	 */
	void Process(const StatsReport& report);

	// Safe from any thread
	AggregateSnapshot snapshot() const;

private:
	void LogTotals(const char* prefix) const;

	StatsChannel& channel_;
	StopToken stop_;
	std::chrono::milliseconds poll_timeout_;
	std::chrono::steady_clock::time_point start_time_;

	AggregateTotals totals_;  // aggregator thread only
	std::atomic<uint64_t> published_packets_{0};
	std::atomic<uint64_t> published_bytes_{0};
	std::atomic<uint64_t> reports_{0};
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_STATS_AGGREGATOR_H_
