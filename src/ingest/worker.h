#ifndef FIREHOSE_INGEST_WORKER_H_
#define FIREHOSE_INGEST_WORKER_H_

#include <atomic>
#include <chrono>
#include <cstdint>

#include "absl/synchronization/mutex.h"

#include "common/cancellation.h"
#include "common/config.h"
#include "transport/transport_channel.h"
#include "handoff_queue.h"
#include "stats_channel.h"

namespace Firehose {

/**
 * Per-connection receive counters. Owned by one Read Loop.
 */
struct ConnectionCounters {
	uint64_t packets_received = 0;
	uint64_t bytes_received = 0;
	std::chrono::steady_clock::time_point start_time;
	std::chrono::steady_clock::time_point last_packet_time;
	double avg_rate = 0.0;

	void Record(size_t bytes, std::chrono::steady_clock::time_point now) {
		packets_received++;
		bytes_received += bytes;
		last_packet_time = now;
		double elapsed = std::chrono::duration<double>(now - start_time).count();
		if (elapsed > 0) {
			avg_rate = static_cast<double>(packets_received) / elapsed;
		}
	}
};

struct ReadLoopOptions {
	size_t read_size = kReadSize;
	uint64_t report_interval = kReportInterval;
	int poll_timeout_ms = static_cast<int>(kQueuePollMs);
};

enum class ReadLoopExit { kPeerClosed, kError, kCancelled };

struct ReadLoopResult {
	ReadLoopExit exit = ReadLoopExit::kError;
	ConnectionCounters counters;  // final values, for logging only
};

/**
 * Reads fixed-size units from `channel` until the peer closes, an error
 * occurs, or `stop` is requested. Every `report_interval` packets a
 * StatsReport goes to `emit`. The caller closes the channel afterwards.
 */
ReadLoopResult RunReadLoop(TransportChannel& channel, int worker_id,
		const ReadLoopOptions& options, const StopToken& stop, const StatsEmitter& emit);

/**
 * Worker pool member: pulls hand-off entries and runs one Read Loop per entry.
 */
class Worker {
public:
	Worker(int worker_id, HandoffQueue& queue, StatsEmitter emit,
			ReadLoopOptions options, StopToken stop);

	/**
	 * Thread body. Returns after consuming a sentinel.
	 */
	void Run();

	/**
	 * Shuts down the connection currently being read, if any, so a blocked
	 * Read Loop sees EOF. Safe to call from another thread; a no-op once the
	 * worker has released the connection, even if its descriptor number has
	 * been reused.
	 */
	void ForceCloseActive();

	int id() const { return worker_id_; }
	uint64_t connections_handled() const { return connections_handled_.load(std::memory_order_relaxed); }

private:
	void HandleConnection(HandoffEntry entry);

	int worker_id_;
	HandoffQueue& queue_;
	StatsEmitter emit_;
	ReadLoopOptions options_;
	StopToken stop_;

	// Descriptor of the active connection, -1 when idle. Cleared under mu_
	// before the descriptor is closed, so ForceCloseActive never sees a stale one.
	absl::Mutex mu_;
	int active_fd_ = -1;
	std::atomic<uint64_t> connections_handled_{0};
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_WORKER_H_
