#pragma once

#include <ttlcache/Cache.hpp>
#include <atomic>
#include <memory>
#include <string>

/**
 * @brief Ограничитель запросов с фиксированным окном
 *
 * Счётчик клиента живёт в кэше ровно одно окно: по истечении TTL
 * он пропадает, и следующий запрос открывает новое окно.
 * Клиенты, которые больше не приходят, вычищаются Sweeper.
 *
 * @note Пара get/setEx не атомарна: два одновременных первых запроса
 *       клиента могут открыть окно дважды. Для демо этого достаточно.
 */
class RateLimiter {
public:
    using Counter = std::shared_ptr<std::atomic<int>>;

    RateLimiter(int limit, std::chrono::milliseconds window)
        : limit_(limit)
        , window_(window)
        , counters_(CacheOptions<std::string, Counter>()
                        .withSweepInterval(window))
    {}

    /**
     * @brief Разрешить или отклонить очередной запрос клиента
     */
    bool allow(const std::string& client) {
        if (auto counter = counters_.get(client)) {
            return ++(**counter) <= limit_;
        }
        counters_.setEx(client, std::make_shared<std::atomic<int>>(1), window_);
        return limit_ >= 1;
    }

    size_t trackedClients() const {
        return counters_.size();
    }

private:
    int limit_;
    std::chrono::milliseconds window_;
    Cache<std::string, Counter> counters_;
};
