#include <gtest/gtest.h>
#include "../../src/ingest/handoff_queue.h"
#include <fcntl.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <thread>

using namespace Firehose;
using namespace std::chrono_literals;

namespace {

HandoffEntry MakeEntry(uint16_t port) {
    HandoffEntry entry;
    entry.peer = PeerIdentity{"127.0.0.1", port};
    return entry;
}

} // namespace

TEST(HandoffQueueTest, FifoOrder) {
    HandoffQueue queue(4);
    queue.Push(MakeEntry(1));
    queue.Push(MakeEntry(2));

    HandoffEntry out;
    ASSERT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kEntry);
    EXPECT_EQ(out.peer.port, 1);
    ASSERT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kEntry);
    EXPECT_EQ(out.peer.port, 2);
}

TEST(HandoffQueueTest, PopTimesOutWhenEmpty) {
    HandoffQueue queue(2);
    HandoffEntry out;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(queue.Pop(out, 20ms), HandoffQueue::PopResult::kTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(HandoffQueueTest, SentinelAfterEntries) {
    HandoffQueue queue(4);
    queue.Push(MakeEntry(7));
    queue.PushSentinel();

    HandoffEntry out;
    EXPECT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kEntry);
    EXPECT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kSentinel);
}

TEST(HandoffQueueTest, PushBlocksWhenFull) {
    constexpr size_t kCapacity = 2;
    HandoffQueue queue(kCapacity);
    queue.Push(MakeEntry(1));
    queue.Push(MakeEntry(2));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.Push(MakeEntry(3));
        pushed = true;
    });

    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(pushed.load());

    HandoffEntry out;
    ASSERT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kEntry);
    producer.join();
    EXPECT_TRUE(pushed.load());
}

TEST(HandoffQueueTest, EntryOwnsDescriptor) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    ScopedFd writer(fds[1]);

    {
        HandoffQueue queue(2);
        HandoffEntry entry;
        entry.handle = ScopedFd(fds[0]);
        queue.Push(std::move(entry));

        HandoffEntry out;
        ASSERT_EQ(queue.Pop(out, 10ms), HandoffQueue::PopResult::kEntry);
        EXPECT_EQ(out.handle.get(), fds[0]);
    }

    // Read end closed with the popped entry
    EXPECT_EQ(fcntl(fds[0], F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
}
