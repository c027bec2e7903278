// Sole owner of one socket or epoll descriptor. Accepted connections travel
// through the hand-off queue as ScopedFds, so whoever drops the entry last
// (worker, queue teardown, a failed connect attempt) closes it.
#ifndef FIREHOSE_COMMON_SCOPED_FD_H_
#define FIREHOSE_COMMON_SCOPED_FD_H_

#include <unistd.h>
#include <utility>

namespace Firehose {

class ScopedFd {
public:
	ScopedFd() = default;
	explicit ScopedFd(int fd) : fd_(fd) {}

	~ScopedFd() { reset(); }

	ScopedFd(const ScopedFd&) = delete;
	ScopedFd& operator=(const ScopedFd&) = delete;

	ScopedFd(ScopedFd&& other) noexcept : fd_(other.release()) {}
	ScopedFd& operator=(ScopedFd&& other) noexcept {
		if (this != &other) {
			reset(other.release());
		}
		return *this;
	}

	int get() const { return fd_; }
	bool valid() const { return fd_ >= 0; }

	// Closes the held descriptor, if any, and takes `fd` instead.
	void reset(int fd = -1) {
		int old = std::exchange(fd_, fd);
		if (old >= 0) {
			::close(old);
		}
	}

	int release() { return std::exchange(fd_, -1); }

private:
	int fd_ = -1;
};

} // namespace Firehose

#endif  // FIREHOSE_COMMON_SCOPED_FD_H_
