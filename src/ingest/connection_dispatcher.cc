#include "connection_dispatcher.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <thread>

#include <glog/logging.h>

namespace Firehose {

ConnectionDispatcher::ConnectionDispatcher(std::string host, int port, int backlog,
		int socket_buffer_bytes, std::chrono::microseconds accept_retry,
		HandoffQueue& queue, StopToken stop)
	: host_(std::move(host)),
	port_(port),
	backlog_(backlog),
	socket_buffer_bytes_(socket_buffer_bytes),
	accept_retry_(accept_retry),
	queue_(queue),
	stop_(std::move(stop)) {}

bool ConnectionDispatcher::Bind() {
	ScopedFd server_socket(socket(AF_INET, SOCK_STREAM, 0));
	if (!server_socket.valid()) {
		LOG(ERROR) << "Socket creation failed: " << strerror(errno);
		return false;
	}

	if (!ApplySocketTuning(server_socket.get(), SocketTuning::Listener(socket_buffer_bytes_))) {
		return false;
	}

	if (!SetNonBlocking(server_socket.get())) {
		return false;
	}

	struct sockaddr_in server_address;
	int rc = ResolveIPv4(host_, static_cast<uint16_t>(port_), server_address);
	if (rc != 0) {
		LOG(ERROR) << "Invalid listen address " << host_;
		return false;
	}

	if (bind(server_socket.get(), reinterpret_cast<struct sockaddr*>(&server_address),
				sizeof(server_address)) < 0) {
		LOG(ERROR) << "Error binding socket to " << host_ << ":" << port_ << ": " << strerror(errno);
		return false;
	}

	if (listen(server_socket.get(), backlog_) == -1) {
		LOG(ERROR) << "Error starting listener: " << strerror(errno);
		return false;
	}

	struct sockaddr_in bound;
	socklen_t bound_len = sizeof(bound);
	if (getsockname(server_socket.get(), reinterpret_cast<struct sockaddr*>(&bound), &bound_len) < 0) {
		LOG(ERROR) << "getsockname failed: " << strerror(errno);
		return false;
	}
	bound_port_ = ntohs(bound.sin_port);

	listener_ = std::move(server_socket);
	LOG(INFO) << "Listening on " << host_ << ":" << bound_port_ << " (backlog " << backlog_ << ")";
	return true;
}

void ConnectionDispatcher::Run() {
	if (!listener_.valid()) {
		LOG(ERROR) << "Accept loop started without a bound listener";
		return;
	}

	const SocketTuning client_tuning = SocketTuning::Stream(socket_buffer_bytes_);

	while (!stop_.stop_requested()) {
		struct sockaddr_storage client_addr;
		socklen_t client_addr_len = sizeof(client_addr);

		int client_socket = accept(listener_.get(),
				reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

		if (client_socket < 0) {
			if (errno == EAGAIN || errno == EWOULDBLOCK) {
				// No connection pending
				std::this_thread::sleep_for(accept_retry_);
				continue;
			}
			if (errno == EINTR || errno == ECONNABORTED) {
				continue;
			}
			if (!stop_.stop_requested()) {
				LOG(ERROR) << "Socket error: " << strerror(errno);
			}
			break;
		}

		HandoffEntry entry;
		entry.handle = ScopedFd(client_socket);
		entry.peer = PeerFromSockaddr(client_addr);
		LOG(INFO) << "New connection from " << entry.peer.ToString();

		// Accepted sockets must block: workers rely on blocking reads
		if (!SetNonBlocking(entry.handle.get(), false) ||
				!ApplySocketTuning(entry.handle.get(), client_tuning)) {
			LOG(ERROR) << "Dropping connection from " << entry.peer.ToString()
				<< ": socket tuning failed";
			continue;
		}

		// Blocks while the queue is full
		queue_.Push(std::move(entry));
		accepted_.fetch_add(1, std::memory_order_relaxed);
	}

	listener_.reset();
	LOG(INFO) << "Accept loop stopped after " << accepted() << " connections";
}

} // namespace Firehose
