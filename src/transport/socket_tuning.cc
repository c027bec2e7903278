#include "socket_tuning.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/tcp.h>
#include <cerrno>
#include <cstring>

#include <glog/logging.h>

namespace Firehose {

bool SetNonBlocking(int fd, bool non_blocking) {
	int flags = fcntl(fd, F_GETFL, 0);
	if (flags == -1) {
		LOG(ERROR) << "fcntl F_GETFL failed: " << strerror(errno);
		return false;
	}

	flags = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
	if (fcntl(fd, F_SETFL, flags) == -1) {
		LOG(ERROR) << "fcntl F_SETFL failed: " << strerror(errno);
		return false;
	}
	return true;
}

bool ApplySocketTuning(int fd, const SocketTuning& tuning) {
	int flag = 1;

	if (tuning.reuse_addr &&
			setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) < 0) {
		LOG(ERROR) << "setsockopt(SO_REUSEADDR) failed: " << strerror(errno);
		return false;
	}

	if (tuning.keepalive &&
			setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag)) < 0) {
		LOG(ERROR) << "setsockopt(SO_KEEPALIVE) failed: " << strerror(errno);
		return false;
	}

	// Disable Nagle's algorithm
	if (tuning.nodelay &&
			setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) != 0) {
		LOG(ERROR) << "setsockopt(TCP_NODELAY) failed: " << strerror(errno);
		return false;
	}

	if (tuning.buffer_bytes > 0) {
		int size = tuning.buffer_bytes;
		if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &size, sizeof(size)) == -1) {
			LOG(ERROR) << "setsockopt(SO_RCVBUF) failed: " << strerror(errno);
			return false;
		}
		if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &size, sizeof(size)) == -1) {
			LOG(ERROR) << "setsockopt(SO_SNDBUF) failed: " << strerror(errno);
			return false;
		}
	}

	return true;
}

PeerIdentity PeerFromSockaddr(const struct sockaddr_storage& addr) {
	PeerIdentity peer;
	char buf[INET6_ADDRSTRLEN] = {0};

	if (addr.ss_family == AF_INET) {
		const auto* in = reinterpret_cast<const struct sockaddr_in*>(&addr);
		inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf));
		peer.port = ntohs(in->sin_port);
	} else if (addr.ss_family == AF_INET6) {
		const auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
		inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf));
		peer.port = ntohs(in6->sin6_port);
	}
	peer.address = buf;
	return peer;
}

int ResolveIPv4(const std::string& host, uint16_t port, struct sockaddr_in& out) {
	memset(&out, 0, sizeof(out));
	out.sin_family = AF_INET;
	out.sin_port = htons(port);

	// Fast path for literals
	if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
		return 0;
	}

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_STREAM;

	struct addrinfo* result = nullptr;
	int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
	if (rc != 0) {
		return rc;
	}
	const auto* in = reinterpret_cast<const struct sockaddr_in*>(result->ai_addr);
	out.sin_addr = in->sin_addr;
	freeaddrinfo(result);
	return 0;
}

} // namespace Firehose
