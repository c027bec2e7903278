#include "stats_aggregator.h"

#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "common/config.h"

namespace Firehose {

bool AggregateTotals::Apply(const StatsReport& report) {
	// An unseen connection starts from zero
	StatsReport& prev = prev_[Key(report.worker_id, report.connection_id)];
	bool advanced = false;

	if (report.packets_received > prev.packets_received) {
		total_packets_ += report.packets_received - prev.packets_received;
		advanced = true;
	}
	if (report.bytes_received > prev.bytes_received) {
		total_bytes_ += report.bytes_received - prev.bytes_received;
		advanced = true;
	}
	prev = report;
	return advanced;
}

StatsAggregator::StatsAggregator(StatsChannel& channel, StopToken stop,
		std::chrono::milliseconds poll_timeout)
	: channel_(channel),
	stop_(std::move(stop)),
	poll_timeout_(poll_timeout),
	start_time_(std::chrono::steady_clock::now()) {}

void StatsAggregator::Run() {
	LOG(INFO) << "Stats aggregator started";
	StatsReport report;

	while (!stop_.stop_requested()) {
		if (channel_.Poll(report, poll_timeout_)) {
			Process(report);
		}
	}

	// Workers are joined before we are stopped; whatever is queued is final
	while (channel_.TryPoll(report)) {
		Process(report);
	}

	LogTotals("Final totals: ");
}

void StatsAggregator::Process(const StatsReport& report) {
	VLOG(3) << "Report from worker " << report.worker_id << " for " << report.connection_id
		<< ": " << report.packets_received << " packets";
	totals_.Apply(report);
	published_packets_.store(totals_.total_packets(), std::memory_order_relaxed);
	published_bytes_.store(totals_.total_bytes(), std::memory_order_relaxed);
	reports_.fetch_add(1, std::memory_order_relaxed);
	LogTotals("");
}

AggregateSnapshot StatsAggregator::snapshot() const {
	AggregateSnapshot s;
	s.total_packets = published_packets_.load(std::memory_order_relaxed);
	s.total_bytes = published_bytes_.load(std::memory_order_relaxed);
	s.reports = reports_.load(std::memory_order_relaxed);
	return s;
}

void StatsAggregator::LogTotals(const char* prefix) const {
	double elapsed = std::chrono::duration<double>(
			std::chrono::steady_clock::now() - start_time_).count();
	double rate = elapsed > 0 ? static_cast<double>(totals_.total_packets()) / elapsed : 0.0;

	std::ostringstream line;
	line << prefix << "Total: " << totals_.total_packets() << " packets, "
		<< totals_.total_bytes() << " bytes, Rate: "
		<< std::fixed << std::setprecision(1) << rate << " packets/sec";
	LOG(INFO) << line.str();
}

} // namespace Firehose
