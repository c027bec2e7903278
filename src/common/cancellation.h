#ifndef FIREHOSE_COMMON_CANCELLATION_H_
#define FIREHOSE_COMMON_CANCELLATION_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "absl/synchronization/notification.h"
#include "absl/time/time.h"

namespace Firehose {

namespace internal {

struct StopState {
	std::atomic<bool> requested{false};
	absl::Notification notification;
};

} // namespace internal

/**
 * Read side of a cancellation request. Cheap to copy; every loop that must
 * stop on request receives one at construction.
 */
class StopToken {
public:
	StopToken() = default;

	bool stop_requested() const {
		return state_ && state_->notification.HasBeenNotified();
	}

	/**
	 * Sleeps for at most `d`, waking early if a stop is requested.
	 * @return true if a stop was requested
	 */
	template <typename Rep, typename Period>
	bool WaitFor(std::chrono::duration<Rep, Period> d) const {
		if (!state_) {
			std::this_thread::sleep_for(d);
			return false;
		}
		return state_->notification.WaitForNotificationWithTimeout(absl::FromChrono(
					std::chrono::duration_cast<std::chrono::nanoseconds>(d)));
	}

private:
	friend class StopSource;
	explicit StopToken(std::shared_ptr<internal::StopState> s) : state_(std::move(s)) {}

	std::shared_ptr<internal::StopState> state_;
};

/**
 * Owner side of a cancellation request. RequestStop() is idempotent.
 */
class StopSource {
public:
	StopSource() : state_(std::make_shared<internal::StopState>()) {}

	StopToken token() const { return StopToken(state_); }

	void RequestStop() {
		// Notification::Notify() must run exactly once.
		if (!state_->requested.exchange(true)) {
			state_->notification.Notify();
		}
	}

	bool stop_requested() const { return state_->notification.HasBeenNotified(); }

private:
	std::shared_ptr<internal::StopState> state_;
};

} // namespace Firehose

#endif // FIREHOSE_COMMON_CANCELLATION_H_
