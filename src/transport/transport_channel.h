#ifndef FIREHOSE_TRANSPORT_TRANSPORT_CHANNEL_H_
#define FIREHOSE_TRANSPORT_TRANSPORT_CHANNEL_H_

#include <cstddef>
#include <utility>

#include "common/scoped_fd.h"
#include "socket_tuning.h"

namespace Firehose {

enum class IoStatus {
	kOk,          // bytes > 0 transferred
	kWouldBlock,  // socket buffer full/empty on a non-blocking socket, or poll timeout
	kClosed,      // peer closed: zero-length transfer, reset or broken pipe on write
	kError
};

struct IoResult {
	IoStatus status = IoStatus::kError;
	size_t bytes = 0;
	int error = 0;  // errno for kError/kClosed

	static IoResult Ok(size_t n) { return {IoStatus::kOk, n, 0}; }
	static IoResult WouldBlock() { return {IoStatus::kWouldBlock, 0, 0}; }
	static IoResult Closed(int err = 0) { return {IoStatus::kClosed, 0, err}; }
	static IoResult Error(int err) { return {IoStatus::kError, 0, err}; }
};

/**
 * Byte-stream connection. No framing: what one side writes in one call may
 * arrive in any number of reads on the other side.
 */
class TransportChannel {
public:
	virtual ~TransportChannel() = default;

	/**
	 * Reads at most `len` bytes.
	 */
	virtual IoResult Read(void* buf, size_t len) = 0;

	/**
	 * Writes at most `len` bytes. A short write returns kOk with the count.
	 */
	virtual IoResult Write(const void* buf, size_t len) = 0;

	/**
	 * Waits until the channel is readable.
	 * @return kOk when readable, kWouldBlock on timeout, kError otherwise
	 */
	virtual IoStatus WaitReadable(int timeout_ms) = 0;

	virtual void Close() = 0;
	virtual bool is_open() const = 0;
	virtual const PeerIdentity& peer() const = 0;
};

/**
 * TransportChannel over a connected TCP socket. Owns the descriptor.
 */
class TcpChannel : public TransportChannel {
public:
	TcpChannel(ScopedFd fd, PeerIdentity peer) : fd_(std::move(fd)), peer_(std::move(peer)) {}

	IoResult Read(void* buf, size_t len) override;
	IoResult Write(const void* buf, size_t len) override;
	IoStatus WaitReadable(int timeout_ms) override;

	void Close() override { fd_.reset(); }
	bool is_open() const override { return fd_.valid(); }
	const PeerIdentity& peer() const override { return peer_; }

	int fd() const { return fd_.get(); }

private:
	ScopedFd fd_;
	PeerIdentity peer_;
};

} // namespace Firehose

#endif // FIREHOSE_TRANSPORT_TRANSPORT_CHANNEL_H_
