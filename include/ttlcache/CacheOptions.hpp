#pragma once

#include <ttlcache/Entry.hpp>
#include <ttlcache/expiration/IExpirationStrategy.hpp>
#include <ttlcache/expiration/ExpirePartial.hpp>
#include <ttlcache/listeners/ICacheListener.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>
#include <utility>

/**
 * @brief Настройки кэша, применяемые один раз при создании
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Значения по умолчанию:
 * - sweepInterval = 10 секунд
 * - strategy = ExpirePartial(1000, 0.2)
 * - initialCapacity = 0 (без резервирования)
 * - слушателей нет
 *
 * @code
 *   auto options = CacheOptions<std::string, int>()
 *       .withSweepInterval(std::chrono::seconds(1))
 *       .withStrategy(std::make_shared<ExpireAll<std::string, int>>())
 *       .withInitialCapacity(10000);
 *
 *   Cache<std::string, int> cache(options);
 * @endcode
 */
template<typename K, typename V>
struct CacheOptions {
    using Duration = ExpiryTime::Duration;
    using StrategyPtr = std::shared_ptr<IExpirationStrategy<K, V>>;
    using ListenerPtr = std::shared_ptr<ICacheListener<K, V>>;

    static constexpr std::chrono::seconds kDefaultSweepInterval{10};
    static constexpr int64_t kDefaultBatchSize = 1000;
    static constexpr double kDefaultContinueRatio = 0.2;

    Duration sweepInterval = kDefaultSweepInterval;
    StrategyPtr strategy = std::make_shared<ExpirePartial<K, V>>(
        kDefaultBatchSize, kDefaultContinueRatio);
    size_t initialCapacity = 0;
    std::vector<ListenerPtr> listeners;

    /**
     * @brief Интервал между проходами фоновой очистки
     */
    CacheOptions& withSweepInterval(Duration interval) {
        sweepInterval = interval;
        return *this;
    }

    /**
     * @brief Стратегия активного истечения, которую вызывает Sweeper
     */
    CacheOptions& withStrategy(StrategyPtr newStrategy) {
        strategy = std::move(newStrategy);
        return *this;
    }

    /**
     * @brief Подсказка по числу элементов для предварительного резервирования
     */
    CacheOptions& withInitialCapacity(size_t capacity) {
        initialCapacity = capacity;
        return *this;
    }

    /**
     * @brief Добавить слушателя событий (nullptr игнорируется)
     */
    CacheOptions& withListener(ListenerPtr listener) {
        if (listener) {
            listeners.push_back(std::move(listener));
        }
        return *this;
    }
};
