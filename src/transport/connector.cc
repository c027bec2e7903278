#include "connector.h"

#include <netdb.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <glog/logging.h>

#include "common/configuration.h"

namespace Firehose {

//----------------------------------------------------------------------------
// RetryPolicy
//----------------------------------------------------------------------------

RetryPolicy RetryPolicy::FromConfig() {
	const auto& connect = GetConfig().config().client.connect;
	RetryPolicy policy;
	policy.max_attempts = connect.max_attempts.get();
	policy.initial_backoff = std::chrono::milliseconds(connect.initial_backoff_ms.get());
	policy.multiplier = connect.backoff_multiplier.get();
	policy.max_backoff = std::chrono::milliseconds(connect.max_backoff_ms.get());
	policy.connect_timeout = std::chrono::milliseconds(connect.timeout_ms.get());
	return policy;
}

std::chrono::milliseconds RetryPolicy::NextBackoff(std::chrono::milliseconds current) const {
	auto next = std::chrono::milliseconds(
			static_cast<int64_t>(static_cast<double>(current.count()) * multiplier));
	return std::min(next, max_backoff);
}

//----------------------------------------------------------------------------
// TcpConnector
//----------------------------------------------------------------------------

TcpConnector::TcpConnector(std::string host, uint16_t port, RetryPolicy policy,
		StopToken stop, int socket_buffer_bytes)
	: host_(std::move(host)),
	port_(port),
	policy_(policy),
	stop_(std::move(stop)),
	socket_buffer_bytes_(socket_buffer_bytes) {}

bool TcpConnector::IsFatalConnectError(int err) {
	switch (err) {
		case EACCES:
		case EPERM:
		case EAFNOSUPPORT:
		case EPROTONOSUPPORT:
		case EINVAL:
		case EBADF:
		case ENOTSOCK:
		case EFAULT:
			return true;
		default:
			return false;
	}
}

TcpConnector::AttemptResult TcpConnector::ConnectOnce(ScopedFd& out, int& err) {
	err = 0;

	struct sockaddr_in server_addr;
	int rc = ResolveIPv4(host_, port_, server_addr);
	if (rc != 0) {
		LOG(WARNING) << "Failed to resolve " << host_ << ": " << gai_strerror(rc);
		err = EHOSTUNREACH;
		// Name not (yet) known is expected while the service is starting up
		if (rc == EAI_AGAIN || rc == EAI_NONAME
#ifdef EAI_NODATA
				|| rc == EAI_NODATA
#endif
				) {
			return AttemptResult::kRetryable;
		}
		return AttemptResult::kFatal;
	}

	ScopedFd sock(socket(AF_INET, SOCK_STREAM, 0));
	if (!sock.valid()) {
		err = errno;
		LOG(ERROR) << "Socket creation failed: " << strerror(err);
		return IsFatalConnectError(err) ? AttemptResult::kFatal : AttemptResult::kRetryable;
	}

	if (!ApplySocketTuning(sock.get(), SocketTuning::Stream(socket_buffer_bytes_)) ||
			!SetNonBlocking(sock.get())) {
		err = EINVAL;
		return AttemptResult::kFatal;
	}

	if (connect(sock.get(), reinterpret_cast<const sockaddr*>(&server_addr),
				sizeof(server_addr)) == 0) {
		out = std::move(sock);
		return AttemptResult::kConnected;
	}

	if (errno != EINPROGRESS) {
		err = errno;
		return IsFatalConnectError(err) ? AttemptResult::kFatal : AttemptResult::kRetryable;
	}

	// Connection is in progress, wait for completion with epoll
	ScopedFd efd(epoll_create1(0));
	if (!efd.valid()) {
		err = errno;
		LOG(ERROR) << "epoll_create1 failed: " << strerror(err);
		return AttemptResult::kRetryable;
	}

	struct epoll_event event;
	memset(&event, 0, sizeof(event));
	event.data.fd = sock.get();
	event.events = EPOLLOUT;
	if (epoll_ctl(efd.get(), EPOLL_CTL_ADD, sock.get(), &event) == -1) {
		err = errno;
		LOG(ERROR) << "epoll_ctl failed: " << strerror(err);
		return AttemptResult::kRetryable;
	}

	struct epoll_event events[1];
	int n = epoll_wait(efd.get(), events, 1, static_cast<int>(policy_.connect_timeout.count()));
	if (n == 0) {
		err = ETIMEDOUT;
		return AttemptResult::kRetryable;
	}
	if (n < 0) {
		err = errno;
		return AttemptResult::kRetryable;
	}

	int sock_error = 0;
	socklen_t len = sizeof(sock_error);
	if (getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &sock_error, &len) < 0) {
		err = errno;
		LOG(ERROR) << "getsockopt(SO_ERROR) failed: " << strerror(err);
		return AttemptResult::kRetryable;
	}
	if (sock_error != 0) {
		err = sock_error;
		return IsFatalConnectError(err) ? AttemptResult::kFatal : AttemptResult::kRetryable;
	}

	out = std::move(sock);
	return AttemptResult::kConnected;
}

std::unique_ptr<TransportChannel> TcpConnector::Connect() {
	std::chrono::milliseconds backoff = policy_.initial_backoff;
	last_attempts_ = 0;

	for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
		if (stop_.stop_requested()) {
			LOG(INFO) << "Connect to " << target() << " cancelled";
			return nullptr;
		}

		last_attempts_ = attempt;
		ScopedFd sock;
		int err = 0;
		AttemptResult result = ConnectOnce(sock, err);

		if (result == AttemptResult::kConnected) {
			LOG(INFO) << "Connected to " << target() << " (attempt " << attempt << ")";
			PeerIdentity peer{host_, port_};
			return std::make_unique<TcpChannel>(std::move(sock), std::move(peer));
		}

		if (result == AttemptResult::kFatal) {
			LOG(ERROR) << "Unexpected connection error to " << target() << ": " << strerror(err);
			return nullptr;
		}

		if (attempt == policy_.max_attempts) {
			LOG(ERROR) << "All " << policy_.max_attempts << " connection attempts to "
				<< target() << " failed: " << strerror(err);
			break;
		}

		LOG(WARNING) << "Connection attempt " << attempt << " to " << target() << " failed: "
			<< strerror(err) << ", retrying in " << backoff.count() << "ms...";
		if (stop_.WaitFor(backoff)) {
			LOG(INFO) << "Connect to " << target() << " cancelled";
			return nullptr;
		}
		backoff = policy_.NextBackoff(backoff);
	}

	return nullptr;
}

} // namespace Firehose
