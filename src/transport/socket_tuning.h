#ifndef FIREHOSE_TRANSPORT_SOCKET_TUNING_H_
#define FIREHOSE_TRANSPORT_SOCKET_TUNING_H_

#include <cstdint>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>

#include "common/config.h"

namespace Firehose {

/**
 * Socket options applied to every stream socket of the system.
 * The listener gets reuse/keepalive/buffers; accepted and outbound sockets
 * additionally get TCP_NODELAY.
 */
struct SocketTuning {
	bool reuse_addr = true;
	bool keepalive = true;
	bool nodelay = false;
	int buffer_bytes = kSocketBufferBytes;  // 0 leaves kernel defaults

	static SocketTuning Listener(int buffer_bytes = kSocketBufferBytes) {
		SocketTuning t;
		t.buffer_bytes = buffer_bytes;
		return t;
	}

	static SocketTuning Stream(int buffer_bytes = kSocketBufferBytes) {
		SocketTuning t;
		t.nodelay = true;
		t.buffer_bytes = buffer_bytes;
		return t;
	}
};

/**
 * Applies `tuning` to `fd`. Logs and returns false on the first failing option.
 */
bool ApplySocketTuning(int fd, const SocketTuning& tuning);

bool SetNonBlocking(int fd, bool non_blocking = true);

/**
 * Peer identity of a Connection Handle
 */
struct PeerIdentity {
	std::string address;
	uint16_t port = 0;

	// "address:port", also used as the connection id in Stats Reports
	std::string ToString() const { return address + ":" + std::to_string(port); }
};

PeerIdentity PeerFromSockaddr(const struct sockaddr_storage& addr);

/**
 * Resolves host (name or dotted quad) to an IPv4 address.
 * @return 0 on success, otherwise a getaddrinfo EAI_* code
 */
int ResolveIPv4(const std::string& host, uint16_t port, struct sockaddr_in& out);

} // namespace Firehose

#endif // FIREHOSE_TRANSPORT_SOCKET_TUNING_H_
