#ifndef FIREHOSE_INGEST_INGESTION_SERVICE_H_
#define FIREHOSE_INGEST_INGESTION_SERVICE_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/cancellation.h"
#include "connection_dispatcher.h"
#include "handoff_queue.h"
#include "stats_aggregator.h"
#include "stats_channel.h"
#include "worker.h"

namespace Firehose {

struct IngestOptions {
	std::string host = "0.0.0.0";
	int port = kDefaultPort;
	int max_clients = kDefaultMaxClients;
	int num_workers = 0;  // 0 = auto
	size_t handoff_capacity = 2 * kDefaultMaxClients;
	size_t stats_capacity = kStatsChannelCapacity;
	int socket_buffer_bytes = kSocketBufferBytes;
	std::chrono::microseconds accept_retry{kAcceptRetryUs};
	std::chrono::milliseconds join_timeout{kWorkerJoinTimeoutMs};
	ReadLoopOptions read;

	// Built from Configuration ingest.*
	static IngestOptions FromConfig();
};

/**
 * Owns the listener, the worker pool and the stats aggregator.
 *
 * Start() binds and spawns one dispatcher thread, num_workers worker threads
 * and one aggregator thread. Stop() tears them down in order: dispatcher,
 * workers (sentinels, bounded wait, force close), aggregator.
 */
class IngestionService {
public:
	explicit IngestionService(IngestOptions options);
	~IngestionService();

	/**
	 * @return false if the listener could not be set up; no threads are started
	 */
	bool Start();

	/**
	 * Idempotent.
	 */
	void Stop();

	// Bound port, valid after Start()
	uint16_t port() const;
	AggregateSnapshot totals() const { return aggregator_.snapshot(); }
	int num_workers() const { return options_.num_workers; }

private:
	void WorkerThread(Worker* worker);
	void WaitForWorkers();

	IngestOptions options_;

	StopSource stop_;
	StopSource aggregator_stop_;

	HandoffQueue queue_;
	StatsChannel stats_;
	ConnectionDispatcher dispatcher_;
	StatsAggregator aggregator_;
	std::vector<std::unique_ptr<Worker>> workers_;

	std::thread dispatcher_thread_;
	std::thread aggregator_thread_;
	std::vector<std::thread> worker_threads_;
	std::atomic<int> live_workers_{0};

	bool started_ = false;
	bool stopped_ = false;
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_INGESTION_SERVICE_H_
