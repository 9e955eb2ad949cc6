#include <gtest/gtest.h>
#include <ttlcache/expiration/ExpireAll.hpp>
#include <mutex>
#include <string>

/**
 * @brief Тесты для ExpireAll
 *
 * Проверяем:
 * - Удаляются все истёкшие записи за один проход
 * - Живые и бессрочные записи остаются
 * - mutex не отпускается
 */

using namespace std::chrono_literals;
using Clock = ExpiryTime::Clock;
using Strategy = ExpireAll<int, int>;

TEST(ExpireAllTest, RemovesOnlyExpired) {
    EntryStore<int, int> store;
    auto past = Clock::now() - 1s;
    auto future = Clock::now() + 1h;
    for (int i = 0; i < 100; ++i) {
        store.set(i, {i, i < 30 ? past : future});
    }

    std::mutex mutex;
    std::unique_lock<std::mutex> lock(mutex);
    bool closed = false;
    SweepLock guard(lock, closed);

    ExpireAll<int, int> strategy;
    size_t removed = strategy.sweep(store, guard);

    EXPECT_EQ(removed, 30);
    EXPECT_EQ(store.size(), 70);
    for (int i = 0; i < 30; ++i) {
        EXPECT_EQ(store.find(i), nullptr) << "Key " << i << " should be expired";
    }
    for (int i = 30; i < 100; ++i) {
        EXPECT_NE(store.find(i), nullptr) << "Key " << i << " should survive";
    }
    EXPECT_TRUE(lock.owns_lock());
    EXPECT_EQ(guard.relaxations(), 0);
}

TEST(ExpireAllTest, KeepsNeverExpiringEntries) {
    EntryStore<std::string, int> store;
    store.set("forever", {1, std::nullopt});
    store.set("stale", {2, Clock::now() - 1ms});

    size_t removed = ExpireAll<std::string, int>::expireAll(store, Clock::now());

    EXPECT_EQ(removed, 1);
    EXPECT_NE(store.find("forever"), nullptr);
}

TEST(ExpireAllTest, UsesSingleNowForWholeScan) {
    EntryStore<int, int> store;
    auto base = Clock::now();
    store.set(1, {1, base + 10ms});
    store.set(2, {2, base + 20ms});

    // now между двумя сроками: истекает только первая запись
    size_t removed = Strategy::expireAll(store, base + 15ms);

    EXPECT_EQ(removed, 1);
    EXPECT_EQ(store.find(1), nullptr);
    EXPECT_NE(store.find(2), nullptr);
}

TEST(ExpireAllTest, EmptyStore) {
    EntryStore<int, int> store;

    EXPECT_EQ(Strategy::expireAll(store, Clock::now()), 0);
}

TEST(ExpireAllTest, Name) {
    ExpireAll<int, int> strategy;

    EXPECT_EQ(strategy.name(), "ExpireAll");
}
