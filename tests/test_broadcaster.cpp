#include <gtest/gtest.h>

#include <vector>

#include "relaychat/broadcaster.hpp"
#include "test_support.hpp"

using namespace relaychat;
using test_support::ConnectionPair;
using test_support::make_connection_pair;

namespace {

// Registers n clients. Server-side ends go into the registry, the other ends
// are returned so the test can read what each client received.
class BroadcasterTest : public ::testing::Test {
protected:
    void add_clients(int n) {
        for (int i = 0; i < n; ++i) {
            ConnectionPair pair = make_connection_pair();
            ClientId id = static_cast<ClientId>(clients_.size() + 1);
            pair.left->assign_identity(id, "user" + std::to_string(id));
            pair.right->set_read_timeout(std::chrono::milliseconds(500));
            ASSERT_EQ(registry_.register_client(id, pair.left), RegisterResult::Ok);
            clients_.push_back(pair);
        }
    }

    Connection& client(ClientId id) { return *clients_[id - 1].right; }

    ClientRegistry registry_;
    Broadcaster broadcaster_{registry_};
    std::vector<ConnectionPair> clients_;
};

}

TEST_F(BroadcasterTest, ExcludesTheSender) {
    add_clients(3);

    DeliveryReport r = broadcaster_.broadcast(make_chat(2, "user2", "hi"), 2);
    EXPECT_EQ(r.delivered, 2u);
    EXPECT_TRUE(r.failed.empty());

    Message m;
    ASSERT_EQ(client(1).read_message(m), ReadStatus::Ok);
    EXPECT_EQ(m.body, "hi");
    EXPECT_EQ(m.sender_name, "user2");
    ASSERT_EQ(client(3).read_message(m), ReadStatus::Ok);
    EXPECT_EQ(m.body, "hi");
    EXPECT_EQ(client(2).read_message(m), ReadStatus::Timeout);
}

TEST_F(BroadcasterTest, NoClientExclusionReachesEveryone) {
    add_clients(3);

    DeliveryReport r = broadcaster_.broadcast(make_join(3, "user3"), kNoClient);
    EXPECT_EQ(r.delivered, 3u);

    for (ClientId id = 1; id <= 3; ++id) {
        Message m;
        ASSERT_EQ(client(id).read_message(m), ReadStatus::Ok);
        EXPECT_EQ(m.kind, MessageKind::Join);
    }
}

TEST_F(BroadcasterTest, EmptyRegistryDeliversNothing) {
    DeliveryReport r = broadcaster_.broadcast(make_system("anyone?"), kNoClient);
    EXPECT_EQ(r.delivered, 0u);
    EXPECT_TRUE(r.failed.empty());
}

TEST_F(BroadcasterTest, DeadRecipientIsReportedAndClosedOthersStillServed) {
    add_clients(3);

    // Client 2 vanishes without any goodbye.
    clients_[1].right.reset();

    DeliveryReport r;
    ASSERT_NO_THROW(r = broadcaster_.broadcast(make_chat(1, "user1", "still there?"), 1));
    EXPECT_EQ(r.delivered, 1u);
    ASSERT_EQ(r.failed.size(), 1u);
    EXPECT_EQ(r.failed[0], 2u);
    EXPECT_FALSE(clients_[1].left->alive());

    // The registry entry is left for the recipient's own session to remove.
    EXPECT_TRUE(registry_.contains(2));

    Message m;
    ASSERT_EQ(client(3).read_message(m), ReadStatus::Ok);
    EXPECT_EQ(m.body, "still there?");

    // Later broadcasts keep working for the survivors.
    ASSERT_NO_THROW(r = broadcaster_.broadcast(make_chat(3, "user3", "yes"), 3));
    EXPECT_EQ(r.delivered, 1u);
    ASSERT_EQ(client(1).read_message(m), ReadStatus::Ok);
    EXPECT_EQ(m.body, "yes");
}

TEST_F(BroadcasterTest, PreservesPerSenderOrder) {
    add_clients(2);

    for (int i = 0; i < 50; ++i) {
        broadcaster_.broadcast(make_chat(1, "user1", std::to_string(i)), 1);
    }
    for (int i = 0; i < 50; ++i) {
        Message m;
        ASSERT_EQ(client(2).read_message(m), ReadStatus::Ok);
        EXPECT_EQ(m.body, std::to_string(i));
    }
}
