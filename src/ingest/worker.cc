#include "worker.h"

#include <sys/socket.h>
#include <cstring>
#include <iomanip>
#include <vector>

#include <glog/logging.h>

namespace Firehose {

//----------------------------------------------------------------------------
// Read Loop
//----------------------------------------------------------------------------

ReadLoopResult RunReadLoop(TransportChannel& channel, int worker_id,
		const ReadLoopOptions& options, const StopToken& stop, const StatsEmitter& emit) {
	ReadLoopResult result;
	ConnectionCounters& counters = result.counters;
	counters.start_time = std::chrono::steady_clock::now();

	const std::string connection_id = channel.peer().ToString();
	std::vector<uint8_t> buf(options.read_size);

	while (true) {
		if (stop.stop_requested()) {
			result.exit = ReadLoopExit::kCancelled;
			break;
		}

		// Bounded wait so a cancelled service never hangs on an idle peer
		IoStatus ready = channel.WaitReadable(options.poll_timeout_ms);
		if (ready == IoStatus::kWouldBlock) {
			continue;
		}
		if (ready == IoStatus::kError) {
			LOG(ERROR) << "Worker " << worker_id << " poll failed for " << connection_id
				<< ": " << strerror(errno);
			result.exit = ReadLoopExit::kError;
			break;
		}

		IoResult r = channel.Read(buf.data(), buf.size());
		if (r.status == IoStatus::kWouldBlock) {
			continue;
		}
		if (r.status == IoStatus::kClosed) {
			result.exit = ReadLoopExit::kPeerClosed;
			break;
		}
		if (r.status == IoStatus::kError) {
			LOG(ERROR) << "Error handling client " << connection_id << ": " << strerror(r.error);
			result.exit = ReadLoopExit::kError;
			break;
		}

		counters.Record(r.bytes, std::chrono::steady_clock::now());

		if (counters.packets_received % options.report_interval == 0) {
			StatsReport report;
			report.worker_id = worker_id;
			report.connection_id = connection_id;
			report.packets_received = counters.packets_received;
			report.bytes_received = counters.bytes_received;
			report.avg_rate = counters.avg_rate;
			emit(std::move(report));
		}
	}

	return result;
}

//----------------------------------------------------------------------------
// Worker
//----------------------------------------------------------------------------

Worker::Worker(int worker_id, HandoffQueue& queue, StatsEmitter emit,
		ReadLoopOptions options, StopToken stop)
	: worker_id_(worker_id),
	queue_(queue),
	emit_(std::move(emit)),
	options_(options),
	stop_(std::move(stop)) {}

void Worker::Run() {
	LOG(INFO) << "Worker " << worker_id_ << " started";
	const std::chrono::milliseconds poll(options_.poll_timeout_ms);

	while (true) {
		HandoffEntry entry;
		HandoffQueue::PopResult r = queue_.Pop(entry, poll);
		if (r == HandoffQueue::PopResult::kTimeout) {
			continue;
		}
		if (r == HandoffQueue::PopResult::kSentinel) {
			break;
		}
		HandleConnection(std::move(entry));
	}

	LOG(INFO) << "Worker " << worker_id_ << " shutting down";
}

void Worker::HandleConnection(HandoffEntry entry) {
	const std::string client_id = entry.peer.ToString();
	LOG(INFO) << "Worker " << worker_id_ << " handling client " << client_id;

	{
		absl::MutexLock lock(&mu_);
		active_fd_ = entry.handle.get();
	}
	TcpChannel channel(std::move(entry.handle), std::move(entry.peer));

	try {
		ReadLoopResult result = RunReadLoop(channel, worker_id_, options_, stop_, emit_);
		double elapsed = std::chrono::duration<double>(
				result.counters.last_packet_time - result.counters.start_time).count();
		LOG(INFO) << "Client " << client_id << " disconnected from worker " << worker_id_
			<< " (" << result.counters.packets_received << " packets, "
			<< result.counters.bytes_received << " bytes, "
			<< std::fixed << std::setprecision(1) << result.counters.avg_rate << " packets/sec over "
			<< std::setprecision(2) << (elapsed > 0 ? elapsed : 0.0) << "s)";
	} catch (const std::exception& e) {
		LOG(ERROR) << "Error handling client " << client_id << ": " << e.what();
	}

	// Clear the slot before the descriptor can be reused
	{
		absl::MutexLock lock(&mu_);
		active_fd_ = -1;
	}
	channel.Close();
	connections_handled_.fetch_add(1, std::memory_order_relaxed);
}

void Worker::ForceCloseActive() {
	absl::MutexLock lock(&mu_);
	if (active_fd_ >= 0) {
		LOG(WARNING) << "Worker " << worker_id_ << " still busy, shutting down its connection";
		::shutdown(active_fd_, SHUT_RDWR);
	}
}

} // namespace Firehose
