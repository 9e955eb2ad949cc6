#pragma once

#include "../stub/SlowQuoteApi.hpp"
#include <ttlcache/Cache.hpp>
#include <ttlcache/listeners/StatsListener.hpp>
#include <iomanip>
#include <iostream>
#include <memory>

/**
 * @brief Сервис котировок с мемоизацией запросов
 *
 * Котировка живёт в кэше quoteTtl, после чего следующий запрос
 * снова идёт во внешний API. Брошенные тикеры вычищает Sweeper,
 * так что память не растёт от разовых запросов.
 */
class QuoteService {
public:
    using QuotePtr = std::shared_ptr<const Quote>;

    QuoteService(std::shared_ptr<SlowQuoteApi> api,
                 std::chrono::milliseconds quoteTtl,
                 std::chrono::milliseconds sweepInterval = std::chrono::seconds(1))
        : api_(std::move(api))
        , quoteTtl_(quoteTtl)
        , stats_(std::make_shared<StatsListener<std::string, QuotePtr>>())
        , cache_(CacheOptions<std::string, QuotePtr>()
                     .withSweepInterval(sweepInterval)
                     .withListener(stats_))
    {}

    /**
     * @brief Получить котировку (из кэша или из API)
     */
    QuotePtr getQuote(const std::string& ticker) {
        if (auto cached = cache_.get(ticker)) {
            return *cached;
        }

        auto quote = std::make_shared<const Quote>(api_->fetch(ticker));
        cache_.setEx(ticker, quote, quoteTtl_);
        return quote;
    }

    /**
     * @brief Сколько ещё котировка будет браться из кэша
     */
    std::optional<ExpiryTime::Duration> freshFor(const std::string& ticker) {
        return cache_.ttl(ticker);
    }

    size_t cachedCount() const {
        return cache_.size();
    }

    void printStats() const {
        std::cout << "\n=== QuoteService Statistics ===\n";
        std::cout << "  Hits:      " << stats_->hits() << "\n";
        std::cout << "  Misses:    " << stats_->misses() << "\n";
        std::cout << "  Hit Rate:  " << std::fixed << std::setprecision(1)
                  << (stats_->hitRate() * 100) << "%\n";
        std::cout << "  Expired:   " << stats_->expirations() << " (lazy), "
                  << stats_->swept() << " (sweeper)\n";
        std::cout << "  API calls: " << api_->totalRequests() << "\n\n";
    }

private:
    std::shared_ptr<SlowQuoteApi> api_;
    std::chrono::milliseconds quoteTtl_;
    std::shared_ptr<StatsListener<std::string, QuotePtr>> stats_;
    Cache<std::string, QuotePtr> cache_;
};
