#include <gtest/gtest.h>
#include "PeerTable.hpp"
#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace lanbeacon;

// -----------------------
// HELPER FUNCTIONS
// -----------------------
static PeerRecord makeRecord(const std::string& host, uint16_t port, const std::string& payload,
                             Clock::time_point seen) {
    return PeerRecord(udp::endpoint(boost::asio::ip::make_address(host), port), payload, seen);
}

struct Recorder {
    std::vector<std::vector<PeerRecord>> snapshots;

    PeerTable::PeersCallback callback() {
        return [this](const std::vector<PeerRecord>& peers) { snapshots.push_back(peers); };
    }
};

static const std::chrono::milliseconds TIMEOUT(5000);

// -----------------------
// MERGE TESTS
// -----------------------
TEST(PeerTableTest, FirstMergePublishes) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());

    EXPECT_TRUE(table.merge(makeRecord("10.0.0.5", 9000, "hello", Clock::now())));

    ASSERT_EQ(rec.snapshots.size(), 1u);
    ASSERT_EQ(rec.snapshots[0].size(), 1u);
    EXPECT_EQ(rec.snapshots[0][0].toString(), "hello@10.0.0.5:9000");
    EXPECT_TRUE(samePeers(table.snapshot(), rec.snapshots[0]));
}

TEST(PeerTableTest, SecondReplyFromSameAddressReplaces) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto now = Clock::now();

    table.merge(makeRecord("10.0.0.5", 9000, "hello", now));
    table.merge(makeRecord("10.0.0.5", 9000, "bye", now));

    ASSERT_EQ(rec.snapshots.size(), 2u);
    ASSERT_EQ(rec.snapshots[1].size(), 1u);
    EXPECT_EQ(rec.snapshots[1][0].payload(), "bye");
    EXPECT_EQ(table.size(), 1u);
}

TEST(PeerTableTest, SnapshotsNeverHoldDuplicateAddresses) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto now = Clock::now();

    for (int i = 0; i < 200; ++i) {
        std::string host = "10.0.0." + std::to_string(i % 7);
        uint16_t port = static_cast<uint16_t>(9000 + i % 3);
        table.merge(makeRecord(host, port, "p" + std::to_string(i % 5), now));
    }

    for (auto const& snapshot : rec.snapshots) {
        std::set<std::string> seen;
        for (auto const& r : snapshot) {
            std::string key = r.address().address().to_string() + ":" + std::to_string(r.address().port());
            EXPECT_TRUE(seen.insert(key).second) << "duplicate " << key;
        }
    }
    EXPECT_EQ(table.size(), 21u);
}

TEST(PeerTableTest, IdenticalReplyDoesNotNotify) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto now = Clock::now();

    EXPECT_TRUE(table.merge(makeRecord("10.0.0.5", 9000, "hello", now)));
    EXPECT_FALSE(table.merge(makeRecord("10.0.0.5", 9000, "hello", now + std::chrono::seconds(1))));

    EXPECT_EQ(rec.snapshots.size(), 1u);
}

TEST(PeerTableTest, OrderIndependentOfArrival) {
    auto now = Clock::now();

    PeerTable forward;
    forward.merge(makeRecord("10.0.0.1", 1, "a", now));
    forward.merge(makeRecord("10.0.0.2", 1, "b", now));

    PeerTable backward;
    backward.merge(makeRecord("10.0.0.2", 1, "b", now));
    backward.merge(makeRecord("10.0.0.1", 1, "a", now));

    auto f = forward.snapshot();
    auto b = backward.snapshot();
    ASSERT_EQ(f.size(), 2u);
    EXPECT_EQ(f[0].payload(), "a");
    EXPECT_EQ(f[1].payload(), "b");
    EXPECT_TRUE(samePeers(f, b));
}

// -----------------------
// PRUNE TESTS
// -----------------------
TEST(PeerTableTest, PruneEvictsStaleRecord) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto t0 = Clock::now();

    table.merge(makeRecord("10.0.0.5", 9000, "hello", t0));
    EXPECT_TRUE(table.prune(t0 + TIMEOUT + std::chrono::milliseconds(1), TIMEOUT));

    ASSERT_EQ(rec.snapshots.size(), 2u);
    EXPECT_TRUE(rec.snapshots[1].empty());
    EXPECT_TRUE(table.snapshot().empty());
    EXPECT_EQ(table.size(), 0u);
}

TEST(PeerTableTest, PruneKeepsRecordExactlyAtCutoff) {
    PeerTable table;
    auto t0 = Clock::now();

    table.merge(makeRecord("10.0.0.5", 9000, "hello", t0));
    EXPECT_FALSE(table.prune(t0 + TIMEOUT, TIMEOUT));
    EXPECT_EQ(table.snapshot().size(), 1u);
}

TEST(PeerTableTest, RefreshedRecordSurvives) {
    PeerTable table;
    auto t0 = Clock::now();

    table.merge(makeRecord("10.0.0.5", 9000, "hello", t0));
    table.merge(makeRecord("10.0.0.6", 9000, "world", t0));
    table.merge(makeRecord("10.0.0.5", 9000, "hello", t0 + std::chrono::seconds(4)));

    EXPECT_TRUE(table.prune(t0 + std::chrono::seconds(6), TIMEOUT));

    auto peers = table.snapshot();
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0].toString(), "hello@10.0.0.5:9000");
}

TEST(PeerTableTest, PruneWithNothingStaleDoesNotNotify) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto t0 = Clock::now();

    EXPECT_FALSE(table.prune(t0, TIMEOUT));
    table.merge(makeRecord("10.0.0.5", 9000, "hello", t0));
    EXPECT_FALSE(table.prune(t0 + std::chrono::seconds(1), TIMEOUT));

    EXPECT_EQ(rec.snapshots.size(), 1u);
}

// -----------------------
// LISTENER TESTS
// -----------------------
TEST(PeerTableTest, AllListenersCalledInOrder) {
    PeerTable table;
    std::vector<int> calls;
    table.addListener([&calls](const std::vector<PeerRecord>&) { calls.push_back(1); });
    table.addListener([&calls](const std::vector<PeerRecord>&) { calls.push_back(2); });

    table.merge(makeRecord("10.0.0.5", 9000, "hello", Clock::now()));

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], 1);
    EXPECT_EQ(calls[1], 2);
}

TEST(PeerTableTest, DeliveredSnapshotIsACopy) {
    PeerTable table;
    Recorder rec;
    table.addListener(rec.callback());
    auto now = Clock::now();

    table.merge(makeRecord("10.0.0.5", 9000, "hello", now));
    table.merge(makeRecord("10.0.0.6", 9000, "other", now));

    ASSERT_EQ(rec.snapshots.size(), 2u);
    EXPECT_EQ(rec.snapshots[0].size(), 1u);
    EXPECT_EQ(rec.snapshots[1].size(), 2u);
}

// -----------------------
// CONCURRENCY TESTS
// -----------------------
TEST(PeerTableTest, ConcurrentMergeAndPrune) {
    PeerTable table;
    std::atomic<int> notifications{0};
    std::atomic<bool> outOfOrder{false};
    table.addListener([&](const std::vector<PeerRecord>& peers) {
        notifications++;
        for (size_t i = 1; i < peers.size(); ++i) {
            if (!canonicalLess(peers[i - 1], peers[i])) outOfOrder = true;
        }
    });

    auto t0 = Clock::now();
    std::thread merger([&] {
        for (int i = 0; i < 2000; ++i) {
            table.merge(makeRecord("10.0.1." + std::to_string(i % 50), 7000, "p" + std::to_string(i % 4),
                                   t0 + std::chrono::milliseconds(i)));
        }
    });
    std::thread pruner([&] {
        for (int i = 0; i < 2000; ++i) {
            table.prune(t0 + std::chrono::milliseconds(i), std::chrono::milliseconds(100));
        }
    });
    merger.join();
    pruner.join();

    EXPECT_FALSE(outOfOrder.load());
    EXPECT_GT(notifications.load(), 0);
    EXPECT_LE(table.size(), 50u);
}
