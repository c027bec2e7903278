#ifndef FIREHOSE_INGEST_HANDOFF_QUEUE_H_
#define FIREHOSE_INGEST_HANDOFF_QUEUE_H_

#include <chrono>
#include <optional>
#include <sys/types.h>

#include "folly/MPMCQueue.h"

#include "common/scoped_fd.h"
#include "transport/socket_tuning.h"

namespace Firehose {

/**
 * An accepted connection on its way from the dispatcher to a worker.
 * Ownership of the handle moves with the entry.
 */
struct HandoffEntry {
	ScopedFd handle;
	PeerIdentity peer;
};

/**
 * Bounded hand-off queue between the Connection Dispatcher and the worker
 * pool. An empty optional is the shutdown sentinel; each worker consumes
 * exactly one.
 */
class HandoffQueue {
public:
	enum class PopResult { kEntry, kTimeout, kSentinel };

	explicit HandoffQueue(size_t capacity) : queue_(capacity), capacity_(capacity) {}

	/**
	 * Enqueues an entry, blocking while the queue is full.
	 */
	void Push(HandoffEntry entry) {
		queue_.blockingWrite(std::optional<HandoffEntry>(std::move(entry)));
	}

	void PushSentinel() {
		queue_.blockingWrite(std::nullopt);
	}

	/**
	 * Dequeues with a deadline of now + timeout.
	 */
	PopResult Pop(HandoffEntry& out, std::chrono::milliseconds timeout) {
		std::optional<HandoffEntry> elem;
		auto deadline = std::chrono::steady_clock::now() + timeout;
		if (!queue_.tryReadUntil(deadline, elem)) {
			return PopResult::kTimeout;
		}
		if (!elem.has_value()) {
			return PopResult::kSentinel;
		}
		out = std::move(elem.value());
		return PopResult::kEntry;
	}

	size_t capacity() const { return capacity_; }
	ssize_t size_guess() const { return queue_.sizeGuess(); }

private:
	folly::MPMCQueue<std::optional<HandoffEntry>> queue_;
	size_t capacity_;
};

} // namespace Firehose

#endif // FIREHOSE_INGEST_HANDOFF_QUEUE_H_
