#include <gtest/gtest.h>
#include "../../src/common/configuration.h"
#include "../../src/common/cancellation.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace Firehose;
using namespace std::chrono_literals;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Configuration::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("FIREHOSE_INGEST_PORT");
        unsetenv("FIREHOSE_TARGET_RATE");
        unsetenv("FIREHOSE_RECORD_RESULTS");
        Configuration::getInstance().reset();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsMatchWireConstants) {
    const FirehoseConfig& c = config().config();
    EXPECT_EQ(c.ingest.port.get(), 8888);
    EXPECT_EQ(c.ingest.max_clients.get(), 10);
    EXPECT_EQ(c.ingest.read_size.get(), 32u);
    EXPECT_EQ(c.ingest.report_interval.get(), 100u);
    EXPECT_EQ(c.client.unit_size.get(), 16u);
    EXPECT_EQ(c.client.batch_size.get(), 804u);
    EXPECT_DOUBLE_EQ(c.client.target_rate.get(), 10000.0);
    EXPECT_EQ(c.client.connect.max_attempts.get(), 10);
    EXPECT_EQ(config().getHandoffQueueCapacity(), 20u);
    EXPECT_TRUE(config().validate());
}

TEST_F(ConfigurationTest, LoadFromStringOverridesDefaults) {
    const std::string yaml = R"(
firehose:
  ingest:
    port: 9000
    max_clients: 4
    num_workers: 3
  client:
    target_rate: 2500.5
    connect:
      max_attempts: 2
  results:
    record: true
    dir: /tmp/firehose
)";
    ASSERT_TRUE(config().loadFromString(yaml));

    const FirehoseConfig& c = config().config();
    EXPECT_EQ(config().getIngestPort(), 9000);
    EXPECT_EQ(config().getMaxClients(), 4);
    EXPECT_EQ(config().getNumWorkers(), 3);
    EXPECT_EQ(config().getHandoffQueueCapacity(), 8u);
    EXPECT_DOUBLE_EQ(c.client.target_rate.get(), 2500.5);
    EXPECT_EQ(c.client.connect.max_attempts.get(), 2);
    EXPECT_TRUE(c.results.record.get());
    EXPECT_EQ(c.results.dir.get(), "/tmp/firehose");
    // Untouched keys keep their defaults
    EXPECT_EQ(c.client.batch_size.get(), 804u);
}

TEST_F(ConfigurationTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "firehose_config_test.yaml";
    {
        std::ofstream out(path);
        out << "firehose:\n  ingest:\n    read_size: 16\n";
    }
    ASSERT_TRUE(config().loadFromFile(path));
    EXPECT_EQ(config().config().ingest.read_size.get(), 16u);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(config().loadFromFile("/nonexistent/firehose.yaml"));
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config().loadFromString("firehose: [unclosed"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFileValues) {
    ASSERT_TRUE(config().loadFromString("firehose:\n  ingest:\n    port: 9000\n"));
    setenv("FIREHOSE_INGEST_PORT", "7777", 1);
    setenv("FIREHOSE_TARGET_RATE", "123.5", 1);
    setenv("FIREHOSE_RECORD_RESULTS", "yes", 1);

    EXPECT_EQ(config().getIngestPort(), 7777);
    EXPECT_DOUBLE_EQ(config().config().client.target_rate.get(), 123.5);
    EXPECT_TRUE(config().config().results.record.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("FIREHOSE_INGEST_PORT", "not-a-number", 1);
    EXPECT_EQ(config().getIngestPort(), 8888);
}

TEST_F(ConfigurationTest, ValidationCollectsErrors) {
    config().config().ingest.port.set(70000);
    config().config().client.target_rate.set(0.0);
    config().config().client.batch_size.set(0);

    EXPECT_FALSE(config().validate());
    EXPECT_EQ(config().getValidationErrors().size(), 3u);
}

TEST_F(ConfigurationTest, AutoWorkerCountBoundedByMaxClients) {
    config().config().ingest.max_clients.set(1);
    EXPECT_EQ(config().getNumWorkers(), 1);

    config().config().ingest.max_clients.set(1000);
    int cores = static_cast<int>(std::thread::hardware_concurrency());
    EXPECT_EQ(config().getNumWorkers(), std::max(1, std::min(cores, 1000)));
}

TEST(WorkerCountTest, ExplicitCountWins) {
    EXPECT_EQ(ResolveWorkerCount(3, 1), 3);
    EXPECT_EQ(ResolveWorkerCount(16, 2), 16);
}

TEST(WorkerCountTest, AutoCountNeverExceedsMaxClients) {
    EXPECT_EQ(ResolveWorkerCount(0, 1), 1);
    EXPECT_GE(ResolveWorkerCount(0, 2), 1);
    EXPECT_LE(ResolveWorkerCount(0, 2), 2);
    EXPECT_LE(ResolveWorkerCount(-1, 2), 2);
    // Degenerate limits still leave one worker
    EXPECT_EQ(ResolveWorkerCount(0, 0), 1);
}

TEST(PortTest, RangeChecks) {
    EXPECT_TRUE(IsValidPort(1, false));
    EXPECT_TRUE(IsValidPort(65535, false));
    EXPECT_FALSE(IsValidPort(0, false));
    EXPECT_TRUE(IsValidPort(0, true));
    EXPECT_FALSE(IsValidPort(70000, true));
    EXPECT_FALSE(IsValidPort(-1, true));
}

//----------------------------------------------------------------------------
// Cancellation
//----------------------------------------------------------------------------

TEST(CancellationTest, WaitForTimesOutWithoutStop) {
    StopSource source;
    StopToken token = source.token();
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.WaitFor(20ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
    EXPECT_FALSE(token.stop_requested());
}

TEST(CancellationTest, StopWakesWaiter) {
    StopSource source;
    StopToken token = source.token();

    std::thread stopper([&]() {
        std::this_thread::sleep_for(20ms);
        source.RequestStop();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.WaitFor(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    stopper.join();
}

TEST(CancellationTest, RequestStopIsIdempotent) {
    StopSource source;
    source.RequestStop();
    source.RequestStop();
    EXPECT_TRUE(source.stop_requested());
    EXPECT_TRUE(source.token().stop_requested());
}

TEST(CancellationTest, DefaultTokenNeverStops) {
    StopToken token;
    EXPECT_FALSE(token.stop_requested());
    EXPECT_FALSE(token.WaitFor(1ms));
}
