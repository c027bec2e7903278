#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/client/paced_transmitter.h"
#include "../../src/client/simulator.h"
#include "../mocks.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstring>
#include <thread>

using namespace Firehose;
using namespace std::chrono_literals;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {

TransmitterOptions SmallBatchOptions() {
    TransmitterOptions options;
    options.target_rate = 1000.0;
    options.unit_size = 16;
    options.batch_size = 10;  // one batch every 10ms
    options.send_retry_pause = 0us;
    options.stop_timeout = 2000ms;
    return options;
}

std::unique_ptr<Connector> SinkConnector() {
    auto connector = std::make_unique<NiceMock<MockConnector>>();
    ON_CALL(*connector, Connect()).WillByDefault(Invoke([]() { return MakeSinkChannel(); }));
    return connector;
}

std::unique_ptr<Connector> DeadConnector() {
    auto connector = std::make_unique<NiceMock<MockConnector>>();
    ON_CALL(*connector, Connect()).WillByDefault(Invoke([]() {
        return std::unique_ptr<TransportChannel>();
    }));
    return connector;
}

// Loopback port with a bound socket that never listens, so connects are refused
ScopedFd ReserveRefusingPort(uint16_t& port) {
    ScopedFd fd(socket(AF_INET, SOCK_STREAM, 0));
    EXPECT_TRUE(fd.valid());
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    EXPECT_EQ(bind(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    socklen_t len = sizeof(addr);
    EXPECT_EQ(getsockname(fd.get(), reinterpret_cast<sockaddr*>(&addr), &len), 0);
    port = ntohs(addr.sin_port);
    return fd;
}

} // namespace

TEST(PacedTransmitterTest, StartRequiresConnection) {
    PacedTransmitter tx("client_000", SmallBatchOptions(), DeadConnector());
    EXPECT_FALSE(tx.Connect());
    EXPECT_FALSE(tx.Start(100ms));
    EXPECT_FALSE(tx.finished());
}

TEST(PacedTransmitterTest, RunsForDurationAndCountsWholeBatches) {
    PacedTransmitter tx("client_000", SmallBatchOptions(), SinkConnector());
    ASSERT_TRUE(tx.Connect());

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(tx.Start(200ms));
    tx.Wait();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(tx.finished());
    EXPECT_GE(elapsed, 200ms);

    const ClientRunStats& stats = tx.stats();
    EXPECT_GT(stats.packets_sent, 0u);
    EXPECT_EQ(stats.packets_sent % 10, 0u);
    EXPECT_EQ(stats.bytes_sent, stats.packets_sent * 16);
    EXPECT_EQ(stats.errors, 0u);
    // 20 batches scheduled in 200ms, allow scheduling slack
    EXPECT_LE(stats.packets_sent, 22u * 10u);
    EXPECT_GT(stats.avg_rate, 0.0);
}

TEST(PacedTransmitterTest, StopEndsLongRunPromptly) {
    PacedTransmitter tx("client_000", SmallBatchOptions(), SinkConnector());
    ASSERT_TRUE(tx.Connect());
    ASSERT_TRUE(tx.Start(60s));

    std::this_thread::sleep_for(50ms);
    auto start = std::chrono::steady_clock::now();
    tx.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_TRUE(tx.finished());
    EXPECT_GT(tx.stats().packets_sent, 0u);
}

TEST(PacedTransmitterTest, FailedBatchesBecomeErrors) {
    auto connector = std::make_unique<NiceMock<MockConnector>>();
    ON_CALL(*connector, Connect()).WillByDefault(Invoke([]() {
        auto ch = std::make_unique<NiceMock<MockTransportChannel>>();
        ON_CALL(*ch, Write(::testing::_, ::testing::_))
            .WillByDefault(::testing::Return(IoResult::WouldBlock()));
        return std::unique_ptr<TransportChannel>(std::move(ch));
    }));

    PacedTransmitter tx("client_000", SmallBatchOptions(), std::move(connector));
    ASSERT_TRUE(tx.Connect());
    ASSERT_TRUE(tx.Start(50ms));
    tx.Wait();

    EXPECT_EQ(tx.stats().packets_sent, 0u);
    EXPECT_EQ(tx.stats().bytes_sent, 0u);
    EXPECT_GT(tx.stats().errors, 0u);
    EXPECT_EQ(tx.stats().errors % 10, 0u);
}

//----------------------------------------------------------------------------
// Simulator
//----------------------------------------------------------------------------

TEST(SimulatorTest, ClientIdsAreZeroPadded) {
    EXPECT_EQ(Simulator::ClientId(0), "client_000");
    EXPECT_EQ(Simulator::ClientId(7), "client_007");
    EXPECT_EQ(Simulator::ClientId(123), "client_123");
}

TEST(SimulatorTest, DropsClientsThatFailToConnect) {
    Simulator simulator(3, SmallBatchOptions(), [](const std::string& id) {
        return id == "client_001" ? DeadConnector() : SinkConnector();
    });

    ASSERT_TRUE(simulator.StartClients(100ms));
    EXPECT_EQ(simulator.connected_clients(), 2u);
    simulator.WaitForCompletion();
    EXPECT_TRUE(simulator.Done());
    simulator.StopAll();

    SummaryStats s = simulator.GetSummaryStats();
    EXPECT_EQ(s.total_clients, 2u);
    EXPECT_GT(s.total_packets, 0u);
    EXPECT_EQ(s.total_bytes, s.total_packets * 16);
    EXPECT_EQ(s.total_errors, 0u);
    EXPECT_DOUBLE_EQ(s.total_rate, s.avg_rate_per_client * 2);
}

TEST(SimulatorTest, NoConnectedClientsFailsStart) {
    Simulator simulator(2, SmallBatchOptions(), [](const std::string&) { return DeadConnector(); });
    EXPECT_FALSE(simulator.StartClients(100ms));
    EXPECT_EQ(simulator.connected_clients(), 0u);

    SummaryStats s = simulator.GetSummaryStats();
    EXPECT_EQ(s.total_clients, 0u);
}

TEST(SimulatorTest, RequestStopCancelsConnectBackoff) {
    uint16_t port = 0;
    ScopedFd reserved = ReserveRefusingPort(port);

    TransmitterOptions options = SmallBatchOptions();
    options.host = "127.0.0.1";
    options.port = port;
    options.retry.max_attempts = 10;
    options.retry.initial_backoff = 10s;
    options.retry.max_backoff = 10s;
    options.retry.connect_timeout = 500ms;

    // Three clients would otherwise spend minutes in backoff
    Simulator simulator(3, options);
    bool started = true;
    std::thread runner([&]() { started = simulator.StartClients(1s); });

    std::this_thread::sleep_for(100ms);
    auto stop_at = std::chrono::steady_clock::now();
    simulator.RequestStop();
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, 5s);
    EXPECT_FALSE(started);
    EXPECT_TRUE(simulator.stop_requested());
    EXPECT_EQ(simulator.connected_clients(), 0u);
}

TEST(SimulatorTest, RequestStopEndsRunningClients) {
    Simulator simulator(2, SmallBatchOptions(), [](const std::string&) { return SinkConnector(); });
    ASSERT_TRUE(simulator.StartClients(30s));

    std::this_thread::sleep_for(50ms);
    auto stop_at = std::chrono::steady_clock::now();
    simulator.RequestStop();
    simulator.WaitForCompletion();

    EXPECT_LT(std::chrono::steady_clock::now() - stop_at, 5s);
    EXPECT_TRUE(simulator.Done());
    simulator.StopAll();
    EXPECT_GT(simulator.GetSummaryStats().total_packets, 0u);
}
