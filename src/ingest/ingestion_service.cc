#include "ingestion_service.h"

#include <algorithm>

#include <glog/logging.h>

#include "common/configuration.h"

namespace Firehose {

IngestOptions IngestOptions::FromConfig() {
	const Configuration& cfg = GetConfig();
	const auto& ingest = cfg.config().ingest;

	IngestOptions options;
	options.host = ingest.host.get();
	options.port = ingest.port.get();
	options.max_clients = ingest.max_clients.get();
	options.num_workers = ingest.num_workers.get();
	options.handoff_capacity = cfg.getHandoffQueueCapacity();
	options.stats_capacity = ingest.stats_channel_capacity.get();
	options.socket_buffer_bytes = ingest.socket_buffer_bytes.get();
	options.accept_retry = std::chrono::microseconds(ingest.accept_retry_us.get());
	options.join_timeout = std::chrono::milliseconds(ingest.join_timeout_ms.get());
	options.read.read_size = ingest.read_size.get();
	options.read.report_interval = ingest.report_interval.get();
	options.read.poll_timeout_ms = ingest.queue_poll_ms.get();
	return options;
}

IngestionService::IngestionService(IngestOptions options)
	: options_(std::move(options)),
	queue_(std::max<size_t>(1, options_.handoff_capacity)),
	stats_(std::max<size_t>(1, options_.stats_capacity)),
	dispatcher_(options_.host, options_.port, options_.max_clients, options_.socket_buffer_bytes,
			options_.accept_retry, queue_, stop_.token()),
	aggregator_(stats_, aggregator_stop_.token(),
			std::chrono::milliseconds(options_.read.poll_timeout_ms)) {
	// Resolved here so CLI overrides of max_clients bound the auto count too
	options_.num_workers = ResolveWorkerCount(options_.num_workers, options_.max_clients);
}

IngestionService::~IngestionService() {
	Stop();
}

uint16_t IngestionService::port() const {
	return dispatcher_.bound_port();
}

//----------------------------------------------------------------------------
// Lifecycle
//----------------------------------------------------------------------------

bool IngestionService::Start() {
	if (started_) {
		LOG(WARNING) << "Ingestion service already started";
		return true;
	}

	if (!dispatcher_.Bind()) {
		LOG(ERROR) << "Failed to set up listener on " << options_.host << ":" << options_.port;
		return false;
	}
	started_ = true;

	LOG(INFO) << "Starting ingestion service with " << options_.num_workers << " workers, "
		<< "max " << options_.max_clients << " clients, hand-off capacity "
		<< queue_.capacity();

	aggregator_thread_ = std::thread([this]() {
		try {
			aggregator_.Run();
		} catch (const std::exception& e) {
			LOG(ERROR) << "Stats aggregator failed: " << e.what();
		}
	});

	StatsEmitter emit = stats_.Emitter();
	for (int i = 0; i < options_.num_workers; i++) {
		workers_.emplace_back(std::make_unique<Worker>(i, queue_, emit, options_.read, stop_.token()));
	}
	live_workers_.store(options_.num_workers, std::memory_order_release);
	for (auto& worker : workers_) {
		worker_threads_.emplace_back(&IngestionService::WorkerThread, this, worker.get());
	}

	dispatcher_thread_ = std::thread([this]() {
		try {
			dispatcher_.Run();
		} catch (const std::exception& e) {
			LOG(ERROR) << "Accept loop failed: " << e.what();
		}
	});

	return true;
}

void IngestionService::WorkerThread(Worker* worker) {
	try {
		worker->Run();
	} catch (const std::exception& e) {
		LOG(ERROR) << "Worker " << worker->id() << " failed: " << e.what();
	}
	live_workers_.fetch_sub(1, std::memory_order_acq_rel);
}

void IngestionService::Stop() {
	if (!started_ || stopped_) {
		return;
	}
	stopped_ = true;

	LOG(INFO) << "Shutting down ingestion service...";
	stop_.RequestStop();

	// Listener is closed when the accept loop exits
	if (dispatcher_thread_.joinable()) {
		dispatcher_thread_.join();
	}

	for (size_t i = 0; i < workers_.size(); i++) {
		queue_.PushSentinel();
	}
	WaitForWorkers();
	for (auto& t : worker_threads_) {
		if (t.joinable()) {
			t.join();
		}
	}

	// Reports published by the workers are all in the channel by now
	aggregator_stop_.RequestStop();
	if (aggregator_thread_.joinable()) {
		aggregator_thread_.join();
	}

	AggregateSnapshot s = aggregator_.snapshot();
	LOG(INFO) << "Ingestion service stopped: " << dispatcher_.accepted() << " connections accepted, "
		<< s.total_packets << " packets, " << s.total_bytes << " bytes";
}

void IngestionService::WaitForWorkers() {
	auto deadline = std::chrono::steady_clock::now() + options_.join_timeout;
	while (live_workers_.load(std::memory_order_acquire) > 0 &&
			std::chrono::steady_clock::now() < deadline) {
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}

	int remaining = live_workers_.load(std::memory_order_acquire);
	if (remaining > 0) {
		LOG(WARNING) << remaining << " workers did not exit within "
			<< options_.join_timeout.count() << "ms, forcing connections closed";
		for (auto& worker : workers_) {
			worker->ForceCloseActive();
		}
	}
}

} // namespace Firehose
