#include <gtest/gtest.h>
#include "../../src/client/send_pacer.h"
#include "../../src/client/run_stats.h"

using namespace Firehose;
using namespace std::chrono_literals;

TEST(SendPacerTest, FirstBatchIsDueImmediately) {
    auto start = SendPacer::Clock::now();
    SendPacer pacer(10000.0, 804, start);
    EXPECT_TRUE(pacer.Due(start));
    EXPECT_EQ(pacer.next_send_time(), start);
}

TEST(SendPacerTest, AdvanceMovesByOneBatchPeriod) {
    auto start = SendPacer::Clock::now();
    SendPacer pacer(10000.0, 804, start);

    // 804 units at 10 kHz
    EXPECT_EQ(pacer.batch_period(), 80400us);

    pacer.Advance();
    EXPECT_FALSE(pacer.Due(start + 80ms));
    EXPECT_TRUE(pacer.Due(start + 80400us));
}

TEST(SendPacerTest, SleepsHalfTheRemainingTime) {
    auto start = SendPacer::Clock::now();
    SendPacer pacer(1000.0, 100, start);
    pacer.Advance();  // next send at start + 100ms

    EXPECT_EQ(pacer.SleepFor(start), 50ms);
    EXPECT_EQ(pacer.SleepFor(start + 60ms), 20ms);
}

TEST(SendPacerTest, SleepNeverBelowMinimum) {
    auto start = SendPacer::Clock::now();
    SendPacer pacer(1000.0, 100, start);

    // Overdue
    EXPECT_EQ(pacer.SleepFor(start + 1s), 100us);
    // Nearly due
    pacer.Advance();
    EXPECT_EQ(pacer.SleepFor(start + 100ms - 50us), 100us);
}

TEST(SendPacerTest, LateLoopCatchesUp) {
    auto start = SendPacer::Clock::now();
    SendPacer pacer(1000.0, 10, start);  // one batch every 10ms

    auto late = start + 35ms;
    int sends = 0;
    while (pacer.Due(late)) {
        pacer.Advance();
        sends++;
    }
    EXPECT_EQ(sends, 4);
}

TEST(ClientRunStatsTest, FinalBlockFormat) {
    ClientRunStats stats;
    stats.start_time = std::chrono::steady_clock::time_point(0s);
    stats.packets_sent = 8040;
    stats.bytes_sent = 128640;
    stats.errors = 804;
    stats.Finalize(stats.start_time + 2s);

    EXPECT_DOUBLE_EQ(stats.avg_rate, 4020.0);
    EXPECT_EQ(stats.FormatFinal(),
            "=== CLIENT FINAL STATISTICS ===\n"
            "Total packets sent: 8040\n"
            "Total bytes sent: 128640\n"
            "Duration: 2.00s\n"
            "Average rate: 4020.0Hz\n"
            "Errors: 804\n"
            "=== END CLIENT STATISTICS ===");
}

TEST(ClientRunStatsTest, ZeroDurationKeepsRateAtZero) {
    ClientRunStats stats;
    stats.start_time = std::chrono::steady_clock::now();
    stats.packets_sent = 804;
    stats.Finalize(stats.start_time);
    EXPECT_EQ(stats.avg_rate, 0.0);
}
