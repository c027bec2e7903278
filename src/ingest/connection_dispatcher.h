#ifndef FIREHOSE_INGEST_CONNECTION_DISPATCHER_H_
#define FIREHOSE_INGEST_CONNECTION_DISPATCHER_H_

#include <atomic>
#include <chrono>
#include <string>

#include "common/cancellation.h"
#include "common/scoped_fd.h"
#include "transport/socket_tuning.h"
#include "handoff_queue.h"

namespace Firehose {

class ConnectionDispatcher {
public:
	/**
	 * @param host Listen address ("0.0.0.0" for all interfaces)
	 * @param port Listen port; 0 lets the kernel choose
	 * @param backlog listen() backlog
	 * @param socket_buffer_bytes SO_RCVBUF/SO_SNDBUF for listener and accepted sockets
	 * @param accept_retry Pause when no connection is pending
	 */
	ConnectionDispatcher(std::string host, int port, int backlog, int socket_buffer_bytes,
			std::chrono::microseconds accept_retry, HandoffQueue& queue, StopToken stop);

	/**
	 * Creates, tunes, binds and starts listening on the listener socket.
	 * @return false on any failure (logged); the service must not proceed
	 */
	bool Bind();

	/**
	 * Accept loop. Runs until stop is requested or accept fails hard,
	 * then closes the listener.
	 */
	void Run();

	uint16_t bound_port() const { return bound_port_; }
	uint64_t accepted() const { return accepted_.load(std::memory_order_relaxed); }

private:
	std::string host_;
	int port_;
	int backlog_;
	int socket_buffer_bytes_;
	std::chrono::microseconds accept_retry_;
	HandoffQueue& queue_;
	StopToken stop_;

	ScopedFd listener_;
	uint16_t bound_port_ = 0;
	std::atomic<uint64_t> accepted_{0};
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_CONNECTION_DISPATCHER_H_
