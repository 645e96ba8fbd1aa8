#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "relaychat/outbound_queue.hpp"

using namespace relaychat;

TEST(OutboundQueueTest, PopsInFifoOrder) {
    OutboundQueue q;
    ASSERT_TRUE(q.push({make_chat(1, "a", "first"), 1}));
    ASSERT_TRUE(q.push({make_join(2, "b"), kNoClient}));
    EXPECT_EQ(q.size(), 2u);

    Outbound item;
    ASSERT_TRUE(q.pop(item, std::chrono::milliseconds(10)));
    EXPECT_EQ(item.msg.body, "first");
    EXPECT_EQ(item.exclude_id, 1u);
    ASSERT_TRUE(q.pop(item, std::chrono::milliseconds(10)));
    EXPECT_EQ(item.msg.kind, MessageKind::Join);
    EXPECT_EQ(item.exclude_id, kNoClient);
}

TEST(OutboundQueueTest, PopTimesOutWhenEmpty) {
    OutboundQueue q;
    Outbound item;
    EXPECT_FALSE(q.pop(item, std::chrono::milliseconds(20)));
    EXPECT_FALSE(q.drained());
}

TEST(OutboundQueueTest, CloseDrainsThenRefuses) {
    OutboundQueue q;
    ASSERT_TRUE(q.push({make_system("last words"), kNoClient}));
    q.close();

    EXPECT_TRUE(q.closed());
    EXPECT_FALSE(q.drained());
    EXPECT_FALSE(q.push({make_system("too late"), kNoClient}));

    Outbound item;
    ASSERT_TRUE(q.pop(item, std::chrono::milliseconds(10)));
    EXPECT_EQ(item.msg.body, "last words");
    EXPECT_TRUE(q.drained());
    EXPECT_FALSE(q.pop(item, std::chrono::milliseconds(10)));
}

TEST(OutboundQueueTest, CloseWakesWaitingConsumer) {
    OutboundQueue q;
    bool popped = true;
    std::thread consumer([&] {
        Outbound item;
        popped = q.pop(item, std::chrono::seconds(10));
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto start = std::chrono::steady_clock::now();
    q.close();
    consumer.join();

    EXPECT_FALSE(popped);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(OutboundQueueTest, KeepsEachProducersOrder) {
    OutboundQueue q;
    constexpr int kProducers = 4;
    constexpr int kEach = 200;

    std::vector<std::thread> producers;
    for (int p = 1; p <= kProducers; ++p) {
        producers.emplace_back([&q, p] {
            for (int i = 0; i < kEach; ++i) {
                q.push({make_chat(static_cast<ClientId>(p), "p", std::to_string(i)), static_cast<ClientId>(p)});
            }
        });
    }

    std::vector<int> next(kProducers + 1, 0);
    Outbound item;
    for (int n = 0; n < kProducers * kEach; ++n) {
        if (!q.pop(item, std::chrono::seconds(5))) {
            ADD_FAILURE() << "queue ran dry after " << n << " items";
            break;
        }
        ClientId p = item.msg.sender_id;
        EXPECT_EQ(item.msg.body, std::to_string(next[p]));
        ++next[p];
    }
    for (auto& t : producers) t.join();
}
