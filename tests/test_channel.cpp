#include "nicefind/channel.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace nicefind::test {

using namespace std::chrono_literals;

TEST(Channel, DeliversInSendOrderAcrossThreads) {
    auto [sender, receiver] = make_channel<int>(4);
    std::thread producer{[sink = std::move(sender)]() mutable {
        for (int i = 0; i < 1000; ++i) {
            ASSERT_TRUE(sink.send(i));
        }
    }};

    std::vector<int> received;
    while (auto value = receiver.receive()) {
        received.push_back(*value);
    }
    producer.join();

    ASSERT_EQ(received.size(), 1000u);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_EQ(received[static_cast<std::size_t>(i)], i);
    }
}

TEST(Channel, QueuedValuesSurviveSenderClose) {
    auto [sender, receiver] = make_channel<int>(8);
    EXPECT_TRUE(sender.send(1));
    EXPECT_TRUE(sender.send(2));
    sender.close();

    EXPECT_EQ(receiver.receive(), 1);
    EXPECT_EQ(receiver.receive(), 2);
    EXPECT_EQ(receiver.receive(), std::nullopt);
    EXPECT_EQ(receiver.receive(), std::nullopt);
}

TEST(Channel, DestroyingSenderEndsStream) {
    auto [sender, receiver] = make_channel<int>(1);
    {
        auto moved = std::move(sender);
        EXPECT_TRUE(moved.send(7));
    }
    EXPECT_EQ(receiver.receive(), 7);
    EXPECT_EQ(receiver.receive(), std::nullopt);
}

TEST(Channel, SendFailsOnceReceiverCloses) {
    auto [sender, receiver] = make_channel<int>(2);
    EXPECT_FALSE(sender.receiver_closed());
    receiver.close();
    EXPECT_TRUE(sender.receiver_closed());
    EXPECT_FALSE(sender.send(1));
}

TEST(Channel, FullChannelBlocksSenderUntilReceive) {
    auto [sender, receiver] = make_channel<int>(2);
    std::atomic<int> sent{0};
    std::thread producer{[&sent, sink = std::move(sender)]() mutable {
        for (int i = 0; i < 3; ++i) {
            if (!sink.send(i)) {
                return;
            }
            ++sent;
        }
    }};

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (sent.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(sent.load(), 2);

    EXPECT_EQ(receiver.receive(), 0);
    producer.join();
    EXPECT_EQ(sent.load(), 3);
    EXPECT_EQ(receiver.receive(), 1);
    EXPECT_EQ(receiver.receive(), 2);
    EXPECT_EQ(receiver.receive(), std::nullopt);
}

TEST(Channel, ReceiverCloseWakesBlockedSender) {
    auto [sender, receiver] = make_channel<int>(1);
    std::atomic<bool> finished{false};
    std::atomic<bool> last_send_result{true};
    std::thread producer{[&, sink = std::move(sender)]() mutable {
        ASSERT_TRUE(sink.send(1));
        last_send_result = sink.send(2);
        finished = true;
    }};

    std::this_thread::sleep_for(20ms);
    receiver.close();
    producer.join();
    EXPECT_TRUE(finished.load());
    EXPECT_FALSE(last_send_result.load());
}

TEST(Channel, ZeroCapacityIsRejected) {
    EXPECT_THROW(make_channel<int>(0), std::invalid_argument);
}

TEST(Channel, DefaultConstructedEndsAreClosed) {
    Sender<int> sender;
    Receiver<int> receiver;
    EXPECT_FALSE(sender.send(1));
    EXPECT_TRUE(sender.receiver_closed());
    EXPECT_EQ(receiver.receive(), std::nullopt);
}

} // namespace nicefind::test
