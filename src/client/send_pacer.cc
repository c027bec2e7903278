#include "send_pacer.h"

#include <algorithm>
#include <cmath>

#include "common/config.h"

namespace Firehose {

SendPacer::SendPacer(double target_rate, size_t batch_size, Clock::time_point start)
    : next_send_time_(start) {
    // packet_interval * batch_size, in whole nanoseconds
    double period_ns = target_rate > 0 ? static_cast<double>(batch_size) * 1e9 / target_rate : 0.0;
    batch_period_ = std::chrono::nanoseconds(std::llround(period_ns));
}

void SendPacer::Advance() {
    next_send_time_ += batch_period_;
}

std::chrono::nanoseconds SendPacer::SleepFor(Clock::time_point now) const {
    const std::chrono::nanoseconds min_sleep = std::chrono::microseconds(kMinPacingSleepUs);
    auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(next_send_time_ - now);
    return std::max(min_sleep, remaining / 2);
}

} // namespace Firehose
