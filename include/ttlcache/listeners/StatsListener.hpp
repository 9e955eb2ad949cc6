#pragma once

#include <ttlcache/listeners/ICacheListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Собирает:
 * - hits/misses — для расчёта hit rate
 * - inserts/updates — для анализа нагрузки на запись
 * - expirations — записи, удалённые лениво (при чтении)
 * - sweeps/swept — проходы Sweeper и удалённые ими записи
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string, int>>();
 *   Cache<std::string, int> cache(
 *       CacheOptions<std::string, int>().withListener(stats));
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic — события приходят и из потока Sweeper.
 */
template<typename K, typename V>
class StatsListener : public ICacheListener<K, V> {
public:
    void onHit(const K& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const K& key) override {
        (void)key;
        ++misses_;
    }

    void onInsert(const K& key, const V& value) override {
        (void)key; (void)value;
        ++inserts_;
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        (void)key; (void)oldValue; (void)newValue;
        ++updates_;
    }

    void onExpire(const K& key) override {
        (void)key;
        ++expirations_;
    }

    void onSweep(size_t removed, size_t remaining) override {
        (void)remaining;
        ++sweeps_;
        swept_ += removed;
    }

    void onSweeperStart() override {
        ++sweeperStarts_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t inserts() const { return inserts_; }
    uint64_t updates() const { return updates_; }
    uint64_t expirations() const { return expirations_; }
    uint64_t sweeps() const { return sweeps_; }
    uint64_t swept() const { return swept_; }
    uint64_t sweeperStarts() const { return sweeperStarts_; }

    /**
     * @brief Общее количество запросов get()
     */
    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Процент попаданий в кэш (0.0 - 1.0)
     * @return hit rate или 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        hits_ = 0;
        misses_ = 0;
        inserts_ = 0;
        updates_ = 0;
        expirations_ = 0;
        sweeps_ = 0;
        swept_ = 0;
        sweeperStarts_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> inserts_{0};
    std::atomic<uint64_t> updates_{0};
    std::atomic<uint64_t> expirations_{0};
    std::atomic<uint64_t> sweeps_{0};
    std::atomic<uint64_t> swept_{0};
    std::atomic<uint64_t> sweeperStarts_{0};
};
