#include <gtest/gtest.h>
#include "../../src/ingest/worker.h"
#include <sys/socket.h>
#include <mutex>
#include <thread>
#include <vector>

using namespace Firehose;
using namespace std::chrono_literals;

class ReadLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2];
        ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        server_ = ScopedFd(fds[0]);
        peer_ = ScopedFd(fds[1]);

        options_.read_size = 32;
        options_.report_interval = 100;
        options_.poll_timeout_ms = 10;
    }

    void SendBytes(size_t n) {
        std::vector<uint8_t> data(n, 'X');
        size_t off = 0;
        while (off < n) {
            ssize_t w = send(peer_.get(), data.data() + off, n - off, MSG_NOSIGNAL);
            ASSERT_GT(w, 0);
            off += static_cast<size_t>(w);
        }
    }

    StatsEmitter Collector() {
        return [this](StatsReport r) {
            std::lock_guard<std::mutex> lock(mu_);
            reports_.push_back(std::move(r));
        };
    }

    std::vector<StatsReport> reports() {
        std::lock_guard<std::mutex> lock(mu_);
        return reports_;
    }

    ScopedFd server_;
    ScopedFd peer_;
    ReadLoopOptions options_;
    StopSource stop_;

    std::mutex mu_;
    std::vector<StatsReport> reports_;
};

TEST_F(ReadLoopTest, ZeroLengthReadEndsLoop) {
    SendBytes(250 * 32);
    peer_.reset();

    TcpChannel channel(std::move(server_), PeerIdentity{"10.1.1.1", 4242});
    ReadLoopResult result = RunReadLoop(channel, 3, options_, stop_.token(), Collector());

    EXPECT_EQ(result.exit, ReadLoopExit::kPeerClosed);
    EXPECT_EQ(result.counters.packets_received, 250u);
    EXPECT_EQ(result.counters.bytes_received, 250u * 32u);

    auto got = reports();
    ASSERT_EQ(got.size(), 2u);
    EXPECT_EQ(got[0].worker_id, 3);
    EXPECT_EQ(got[0].connection_id, "10.1.1.1:4242");
    EXPECT_EQ(got[0].packets_received, 100u);
    EXPECT_EQ(got[0].bytes_received, 3200u);
    EXPECT_EQ(got[1].packets_received, 200u);
}

TEST_F(ReadLoopTest, ShortReadsCountAsPackets) {
    SendBytes(40);  // one 32-byte read plus one 8-byte read
    peer_.reset();

    TcpChannel channel(std::move(server_), PeerIdentity{"10.1.1.1", 4242});
    ReadLoopResult result = RunReadLoop(channel, 0, options_, stop_.token(), Collector());

    EXPECT_EQ(result.counters.packets_received, 2u);
    EXPECT_EQ(result.counters.bytes_received, 40u);
    EXPECT_TRUE(reports().empty());
}

TEST_F(ReadLoopTest, StopEndsIdleLoop) {
    TcpChannel channel(std::move(server_), PeerIdentity{"10.1.1.1", 4242});

    std::thread stopper([this]() {
        std::this_thread::sleep_for(50ms);
        stop_.RequestStop();
    });
    ReadLoopResult result = RunReadLoop(channel, 0, options_, stop_.token(), Collector());
    stopper.join();

    EXPECT_EQ(result.exit, ReadLoopExit::kCancelled);
    EXPECT_EQ(result.counters.packets_received, 0u);
}

TEST_F(ReadLoopTest, WorkerReleasesHandleAfterPeerCloses) {
    HandoffQueue queue(4);
    Worker worker(1, queue, Collector(), options_, stop_.token());

    HandoffEntry entry;
    entry.handle = std::move(server_);
    entry.peer = PeerIdentity{"10.1.1.1", 4242};
    queue.Push(std::move(entry));

    std::thread t([&]() { worker.Run(); });

    SendBytes(100 * 32);
    shutdown(peer_.get(), SHUT_WR);

    // Worker closes its end once it sees EOF
    char c;
    EXPECT_EQ(recv(peer_.get(), &c, 1, 0), 0);

    queue.PushSentinel();
    t.join();

    EXPECT_EQ(worker.connections_handled(), 1u);
    auto got = reports();
    ASSERT_EQ(got.size(), 1u);
    EXPECT_EQ(got[0].packets_received, 100u);
}

TEST_F(ReadLoopTest, ForceCloseUnblocksBusyWorker) {
    HandoffQueue queue(4);
    options_.poll_timeout_ms = 10000;  // only the forced close can end the read
    Worker worker(2, queue, Collector(), options_, stop_.token());

    HandoffEntry entry;
    entry.handle = std::move(server_);
    entry.peer = PeerIdentity{"10.1.1.1", 4242};
    queue.Push(std::move(entry));
    queue.PushSentinel();

    std::thread t([&]() { worker.Run(); });
    // Wait until the worker has picked up the connection
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (queue.size_guess() > 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(50ms);

    worker.ForceCloseActive();
    t.join();
    EXPECT_EQ(worker.connections_handled(), 1u);
}

TEST_F(ReadLoopTest, ForceCloseAfterReleaseLeavesReusedDescriptorAlone) {
    HandoffQueue queue(4);
    Worker worker(3, queue, Collector(), options_, stop_.token());

    HandoffEntry entry;
    entry.handle = std::move(server_);
    entry.peer = PeerIdentity{"10.1.1.1", 4242};
    queue.Push(std::move(entry));

    std::thread t([&]() { worker.Run(); });
    peer_.reset();
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (worker.connections_handled() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    queue.PushSentinel();
    t.join();
    ASSERT_EQ(worker.connections_handled(), 1u);

    // Lowest free number first, so this normally lands on the released descriptor
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    ScopedFd reused(fds[0]);
    ScopedFd other(fds[1]);

    worker.ForceCloseActive();

    const char out = 'x';
    char in = 0;
    ASSERT_EQ(send(other.get(), &out, 1, MSG_NOSIGNAL), 1);
    EXPECT_EQ(recv(reused.get(), &in, 1, 0), 1);
    EXPECT_EQ(in, 'x');
}
