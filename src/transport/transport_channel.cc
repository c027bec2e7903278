#include "transport_channel.h"

#include <poll.h>
#include <sys/socket.h>
#include <cerrno>

namespace Firehose {

IoResult TcpChannel::Read(void* buf, size_t len) {
	if (!fd_.valid()) {
		return IoResult::Error(EBADF);
	}

	while (true) {
		ssize_t ret = recv(fd_.get(), buf, len, 0);
		if (ret > 0) {
			return IoResult::Ok(static_cast<size_t>(ret));
		}
		if (ret == 0) {
			return IoResult::Closed();
		}
		if (errno == EINTR) {
			continue;
		}
		if (errno == EAGAIN || errno == EWOULDBLOCK) {
			return IoResult::WouldBlock();
		}
		return IoResult::Error(errno);
	}
}

IoResult TcpChannel::Write(const void* buf, size_t len) {
	if (!fd_.valid()) {
		return IoResult::Closed(EBADF);
	}

	while (true) {
		// MSG_NOSIGNAL: a dead peer surfaces as EPIPE instead of SIGPIPE
		ssize_t ret = send(fd_.get(), buf, len, MSG_NOSIGNAL);
		if (ret > 0) {
			return IoResult::Ok(static_cast<size_t>(ret));
		}
		if (ret == 0) {
			return IoResult::Closed();
		}
		switch (errno) {
			case EINTR:
				continue;
			case EAGAIN:
#if EWOULDBLOCK != EAGAIN
			case EWOULDBLOCK:
#endif
			case ENOBUFS:
				return IoResult::WouldBlock();
			case EPIPE:
			case ECONNRESET:
			case ENOTCONN:
				return IoResult::Closed(errno);
			default:
				return IoResult::Error(errno);
		}
	}
}

IoStatus TcpChannel::WaitReadable(int timeout_ms) {
	if (!fd_.valid()) {
		return IoStatus::kError;
	}

	struct pollfd pfd;
	pfd.fd = fd_.get();
	pfd.events = POLLIN;
	pfd.revents = 0;

	int n = poll(&pfd, 1, timeout_ms);
	if (n == 0) {
		return IoStatus::kWouldBlock;
	}
	if (n < 0) {
		return errno == EINTR ? IoStatus::kWouldBlock : IoStatus::kError;
	}
	// POLLHUP/POLLERR still let recv() report EOF or the pending error
	return IoStatus::kOk;
}

} // namespace Firehose
