#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "teamlink/revocation_store.hpp"
#include "teamlink/revocation_sweeper.hpp"
#include "test_support.hpp"

namespace {

// 아래 테스트의 만료 시각(100~1000)보다 앞선 고정 시각.
teamlink::EpochClock Epoch50() {
  return []() { return std::int64_t{50}; };
}

}  // namespace

TEST(RevocationStoreTest, RevokeIsIdempotentCompareAndSet) {
  teamlink::InMemoryRevocationStore store{Epoch50()};
  EXPECT_FALSE(store.IsRevoked("jti-1"));
  EXPECT_TRUE(store.Revoke("jti-1", 100));
  EXPECT_FALSE(store.Revoke("jti-1", 200));
  EXPECT_TRUE(store.IsRevoked("jti-1"));
  EXPECT_EQ(store.Size(), 1u);
}

TEST(RevocationStoreTest, PurgeDropsOnlyExpiredRecords) {
  teamlink::InMemoryRevocationStore store{Epoch50()};
  store.Revoke("old", 100);
  store.Revoke("edge", 150);
  store.Revoke("live", 200);

  EXPECT_EQ(store.PurgeExpired(150), 2u);
  EXPECT_FALSE(store.IsRevoked("old"));
  EXPECT_FALSE(store.IsRevoked("edge"));
  EXPECT_TRUE(store.IsRevoked("live"));
  EXPECT_EQ(store.Size(), 1u);
}

TEST(RevocationStoreTest, RecordStopsCountingOnceTokenExpires) {
  teamlink::testing::ManualClock clock;
  teamlink::InMemoryRevocationStore store{clock.Fn()};
  const auto expires_at = clock.now->load() + 60;
  ASSERT_TRUE(store.Revoke("jti-short", expires_at));
  EXPECT_TRUE(store.IsRevoked("jti-short"));

  clock.Advance(59);
  EXPECT_TRUE(store.IsRevoked("jti-short"));
  clock.Advance(1);
  EXPECT_FALSE(store.IsRevoked("jti-short"));
  // 정리 전까지 레코드는 남아 있고 같은 ID를 다시 폐기할 수는 없다.
  EXPECT_EQ(store.Size(), 1u);
  EXPECT_FALSE(store.Revoke("jti-short", expires_at + 60));
}

TEST(RevocationStoreTest, ConcurrentRevokeOfSameIdHasSingleWinner) {
  teamlink::InMemoryRevocationStore store{Epoch50()};
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&]() {
      if (store.Revoke("shared", 1000)) {
        winners.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(winners.load(), 1);
}

TEST(RevocationStoreTest, ConcurrentRevokeAndLookupLosesNoUpdates) {
  teamlink::InMemoryRevocationStore store{Epoch50()};
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        auto id = std::to_string(t) + "-" + std::to_string(i);
        store.Revoke(id, 1000);
        EXPECT_TRUE(store.IsRevoked(id));
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(store.Size(), static_cast<std::size_t>(kThreads * kPerThread));
}

TEST(RevocationSweeperTest, SweepOnceUsesInjectedClock) {
  boost::asio::io_context ioc;
  auto store = std::make_shared<teamlink::InMemoryRevocationStore>(Epoch50());
  store->Revoke("expired", 10);
  store->Revoke("live", 1000);
  auto sweeper = std::make_shared<teamlink::RevocationSweeper>(ioc, store, std::chrono::seconds(60), nullptr,
                                                               []() { return std::int64_t{500}; });
  EXPECT_EQ(sweeper->SweepOnce(), 1u);
  EXPECT_TRUE(store->IsRevoked("live"));
  EXPECT_FALSE(store->IsRevoked("expired"));
}
