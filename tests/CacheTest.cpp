#include <gtest/gtest.h>
#include <ttlcache/Cache.hpp>
#include <ttlcache/expiration/ExpireAll.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

/**
 * @brief Тесты для Cache
 *
 * Проверяем:
 * - get/setEx/ttl/size на живых и отсутствующих ключах
 * - Ленивое истечение без участия Sweeper
 * - Игнорирование пустых значений и ttl <= 0
 * - close(): повторный вызов, поведение закрытого кэша
 * - Жизненный цикл Sweeper и активное истечение
 */

using namespace std::chrono_literals;

namespace {

using StringCache = Cache<std::string, std::string>;

/// Кэш, Sweeper которого за время теста не проснётся
StringCache::Options lazyOnly() {
    return StringCache::Options().withSweepInterval(std::chrono::hours(1));
}

bool eventually(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return condition();
}

} // namespace

// ==================== Отсутствующие ключи ====================

TEST(CacheTest, GetMissingReturnsNullopt) {
    StringCache cache(lazyOnly());

    EXPECT_FALSE(cache.get("missing").has_value());
}

TEST(CacheTest, TtlMissingReturnsNullopt) {
    StringCache cache(lazyOnly());

    EXPECT_FALSE(cache.ttl("missing").has_value());
}

TEST(CacheTest, InitiallyEmpty) {
    StringCache cache(lazyOnly());

    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.isClosed());
    EXPECT_FALSE(cache.isSweeperRunning());
}

// ==================== setEx / get / ttl ====================

TEST(CacheTest, SetExThenGet) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 10s);

    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "v1");
    EXPECT_EQ(cache.size(), 1);
}

TEST(CacheTest, TtlWithinRequestedBounds) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 500ms);

    auto ttl = cache.ttl("a");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_GT(ttl.value(), StringCache::Duration::zero());
    EXPECT_LE(ttl.value(), 500ms);
}

TEST(CacheTest, TtlNeverReportsZeroRemaining) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 2ms);

    // До самого истечения остаток строго положителен, затем ключа нет
    auto deadline = std::chrono::steady_clock::now() + 1s;
    std::optional<StringCache::Duration> ttl = cache.ttl("a");
    while (ttl.has_value() && std::chrono::steady_clock::now() < deadline) {
        EXPECT_GT(ttl.value(), StringCache::Duration::zero());
        ttl = cache.ttl("a");
    }

    EXPECT_FALSE(ttl.has_value());
    EXPECT_EQ(cache.size(), 0);  // Истёкший ключ удалён вызовом ttl()
}

TEST(CacheTest, OverwriteReplacesValueAndDeadline) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "old", 30ms);
    cache.setEx("a", "new", 10s);

    std::this_thread::sleep_for(50ms);

    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "new");
    EXPECT_EQ(cache.size(), 1);
    EXPECT_GT(cache.ttl("a").value(), 5s);
}

TEST(CacheTest, EmptyStringIsAValue) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "", 10s);

    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "");
}

TEST(CacheTest, HugeTtlDoesNotOverflow) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v", StringCache::Duration::max());

    EXPECT_TRUE(cache.get("a").has_value());
    ASSERT_TRUE(cache.ttl("a").has_value());
    EXPECT_GT(cache.ttl("a").value(), std::chrono::hours(24 * 365));
}

// ==================== Игнорируемые записи ====================

TEST(CacheTest, NonPositiveTtlIgnored) {
    StringCache cache(lazyOnly());

    cache.setEx("zero", "v", 0s);
    cache.setEx("negative", "v", -1s);

    EXPECT_FALSE(cache.get("zero").has_value());
    EXPECT_FALSE(cache.get("negative").has_value());
    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.isSweeperRunning());
}

TEST(CacheTest, EmptyPayloadIgnored) {
    Cache<std::string, std::shared_ptr<int>> cache(
        CacheOptions<std::string, std::shared_ptr<int>>()
            .withSweepInterval(std::chrono::hours(1)));

    cache.setEx("null", nullptr, 10s);
    cache.put("null-forever", std::shared_ptr<int>());

    EXPECT_FALSE(cache.get("null").has_value());
    EXPECT_FALSE(cache.get("null-forever").has_value());
    EXPECT_EQ(cache.size(), 0);
}

TEST(CacheTest, EmptyOptionalIgnored) {
    Cache<std::string, std::optional<int>> cache(
        CacheOptions<std::string, std::optional<int>>()
            .withSweepInterval(std::chrono::hours(1)));

    cache.setEx("none", std::nullopt, 10s);
    cache.setEx("zero", std::optional<int>(0), 10s);

    EXPECT_FALSE(cache.get("none").has_value());
    ASSERT_TRUE(cache.get("zero").has_value());
    EXPECT_EQ(cache.get("zero").value(), 0);
}

TEST(CacheTest, PayloadIsSharedNotCopied) {
    Cache<std::string, std::shared_ptr<std::string>> cache(
        CacheOptions<std::string, std::shared_ptr<std::string>>()
            .withSweepInterval(std::chrono::hours(1)));
    auto payload = std::make_shared<std::string>("big object");

    cache.setEx("a", payload, 10s);

    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value().get(), payload.get());  // Тот же объект
}

// ==================== Ленивое истечение ====================

TEST(CacheTest, LazyExpirationOnGet) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 30ms);
    std::this_thread::sleep_for(50ms);

    // Sweeper ещё не просыпался, но запись уже не видна
    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0);
}

TEST(CacheTest, LazyExpirationOnTtl) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 30ms);
    std::this_thread::sleep_for(50ms);

    EXPECT_FALSE(cache.ttl("a").has_value());
    EXPECT_EQ(cache.size(), 0);
}

TEST(CacheTest, SizeCountsExpiredButNotSwept) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v1", 20ms);
    std::this_thread::sleep_for(40ms);

    EXPECT_EQ(cache.size(), 1);  // Истекла, но ещё не удалена
    cache.get("a");
    EXPECT_EQ(cache.size(), 0);
}

TEST(CacheTest, DefaultOptionsScenario) {
    StringCache cache;

    cache.setEx("a", "v1", 50ms);
    auto value = cache.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "v1");

    std::this_thread::sleep_for(60ms);

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_EQ(cache.size(), 0);
}

// ==================== Бессрочные записи ====================

TEST(CacheTest, PutNeverExpires) {
    StringCache cache(StringCache::Options()
        .withSweepInterval(5ms)
        .withStrategy(std::make_shared<ExpireAll<std::string, std::string>>()));

    cache.put("forever", "v");
    cache.setEx("short", "v", 10ms);

    ASSERT_TRUE(eventually([&] { return cache.size() == 1; }));
    EXPECT_TRUE(cache.get("forever").has_value());
    auto ttl = cache.ttl("forever");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_EQ(ttl.value(), StringCache::Duration::max());
}

// ==================== removeExpired ====================

TEST(CacheTest, RemoveExpiredSweepsImmediately) {
    StringCache cache(lazyOnly());

    for (int i = 0; i < 10; ++i) {
        cache.setEx("short" + std::to_string(i), "v", 10ms);
    }
    cache.setEx("long", "v", 10s);
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(cache.removeExpired(), 10);
    EXPECT_EQ(cache.size(), 1);
}

// ==================== close ====================

TEST(CacheTest, CloseTwiceThrows) {
    StringCache cache(lazyOnly());

    EXPECT_NO_THROW(cache.close());
    EXPECT_THROW(cache.close(), AlreadyClosedError);
    EXPECT_TRUE(cache.isClosed());
}

TEST(CacheTest, AlreadyClosedMessage) {
    StringCache cache(lazyOnly());
    cache.close();

    try {
        cache.close();
        FAIL() << "Expected AlreadyClosedError";
    } catch (const AlreadyClosedError& e) {
        EXPECT_STREQ(e.what(), "cache: already closed");
    }
}

TEST(CacheTest, ClosedCacheBehavesEmpty) {
    StringCache cache(lazyOnly());
    cache.setEx("a", "v1", 10s);

    cache.close();

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(cache.ttl("a").has_value());
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.removeExpired(), 0);
}

TEST(CacheTest, ClosedCacheDropsWrites) {
    StringCache cache(lazyOnly());
    cache.close();

    cache.setEx("a", "v1", 10s);
    cache.put("b", "v2");

    EXPECT_FALSE(cache.get("a").has_value());
    EXPECT_FALSE(cache.get("b").has_value());
    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.isSweeperRunning());
}

// ==================== Sweeper ====================

TEST(CacheTest, FirstWriteStartsSweeper) {
    StringCache cache(lazyOnly());

    cache.setEx("a", "v", 10s);
    EXPECT_TRUE(cache.isSweeperRunning());

    cache.setEx("b", "v", 10s);  // Второй Sweeper не запускается
    EXPECT_TRUE(cache.isSweeperRunning());
}

TEST(CacheTest, SweeperStopsWhenStoreEmpty) {
    StringCache cache(StringCache::Options().withSweepInterval(5ms));

    cache.setEx("a", "v", 10ms);
    ASSERT_TRUE(cache.isSweeperRunning());

    EXPECT_TRUE(eventually([&] { return !cache.isSweeperRunning(); }));
    EXPECT_EQ(cache.size(), 0);

    // Следующая запись снова запускает Sweeper
    cache.setEx("b", "v", 10s);
    EXPECT_TRUE(cache.isSweeperRunning());
}

TEST(CacheTest, ActiveExpirationWithoutReads) {
    StringCache cache(StringCache::Options().withSweepInterval(5ms));

    for (int i = 0; i < 100; ++i) {
        cache.setEx("k" + std::to_string(i), "v", 10ms);
    }

    EXPECT_TRUE(eventually([&] { return cache.size() == 0; }));
}

TEST(CacheTest, CloseWakesSweeperPromptly) {
    StringCache cache(lazyOnly());
    cache.setEx("a", "v", 10s);
    ASSERT_TRUE(cache.isSweeperRunning());

    cache.close();

    // Интервал — час, но Sweeper завершается сразу после close()
    EXPECT_TRUE(eventually([&] { return !cache.isSweeperRunning(); }, 1000ms));
}

TEST(CacheTest, DestructorDoesNotWaitForInterval) {
    auto start = std::chrono::steady_clock::now();
    {
        StringCache cache(lazyOnly());
        cache.setEx("a", "v", 10s);
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 1s);
}

TEST(CacheTest, DestructorAfterCloseIsSafe) {
    auto cache = std::make_unique<StringCache>(lazyOnly());
    cache->setEx("a", "v", 10s);
    cache->close();

    EXPECT_NO_THROW(cache.reset());
}
