#ifndef FIREHOSE_CLIENT_SEND_PACER_H_
#define FIREHOSE_CLIENT_SEND_PACER_H_

#include <chrono>
#include <cstddef>

namespace Firehose {

/**
 * Schedules batch sends so a connection averages `target_rate` units/sec.
 *
 * One batch of `batch_size` units is due whenever now >= next_send_time;
 * each send moves next_send_time forward by batch_size / target_rate.
 * A late loop catches up by sending back-to-back until the schedule is met.
 */
class SendPacer {
public:
    using Clock = std::chrono::steady_clock;

    SendPacer(double target_rate, size_t batch_size, Clock::time_point start);

    bool Due(Clock::time_point now) const { return now >= next_send_time_; }

    // Moves the schedule forward by one batch period
    void Advance();

    /**
     * Sleep before the next check: half the remaining time, never below
     * the minimum pacing sleep.
     */
    std::chrono::nanoseconds SleepFor(Clock::time_point now) const;

    Clock::time_point next_send_time() const { return next_send_time_; }
    std::chrono::nanoseconds batch_period() const { return batch_period_; }

private:
    std::chrono::nanoseconds batch_period_;
    Clock::time_point next_send_time_;
};

} // namespace Firehose

#endif // FIREHOSE_CLIENT_SEND_PACER_H_
