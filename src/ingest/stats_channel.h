#ifndef FIREHOSE_INGEST_STATS_CHANNEL_H_
#define FIREHOSE_INGEST_STATS_CHANNEL_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "folly/MPMCQueue.h"

namespace Firehose {

/**
 * Immutable snapshot of one connection's counters, emitted by a Read Loop.
 */
struct StatsReport {
	int worker_id = 0;
	std::string connection_id;
	uint64_t packets_received = 0;
	uint64_t bytes_received = 0;
	double avg_rate = 0.0;  // informational, not aggregated
};

using StatsEmitter = std::function<void(StatsReport)>;

/**
 * Bounded channel from all workers to the single Stats Aggregator.
 */
class StatsChannel {
public:
	explicit StatsChannel(size_t capacity) : queue_(capacity) {}

	// Blocks while the aggregator is behind.
	void Publish(StatsReport report) {
		queue_.blockingWrite(std::move(report));
	}

	bool Poll(StatsReport& out, std::chrono::milliseconds timeout) {
		return queue_.tryReadUntil(std::chrono::steady_clock::now() + timeout, out);
	}

	bool TryPoll(StatsReport& out) {
		return queue_.read(out);
	}

	StatsEmitter Emitter() {
		return [this](StatsReport report) { Publish(std::move(report)); };
	}

private:
	folly::MPMCQueue<StatsReport> queue_;
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_STATS_CHANNEL_H_
