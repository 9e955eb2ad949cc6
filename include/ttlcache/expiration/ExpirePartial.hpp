#pragma once

#include "IExpirationStrategy.hpp"
#include "ExpireAll.hpp"
#include <cstdint>
#include <random>

/**
 * @brief Пакетный проход с ранним выходом
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Алгоритм:
 * 1. Если записей не больше batchSize — обычный полный проход (ExpireAll)
 * 2. Иначе просматриваем до batchSize записей со случайной корзины,
 *    удаляем истёкшие и считаем долю истёкших в пакете
 * 3. Доля < continueRatio — останавливаемся
 * 4. Иначе отпускаем mutex, уступаем процессор, захватываем снова
 *    и (если кэш не закрыт) берём следующий пакет
 *
 * Таблица с большим количеством истёкших записей чистится пакетами подряд,
 * а в обычном состоянии (истёкших мало) хватает одного дешёвого пакета.
 * Время удержания mutex ограничено примерно одним пакетом.
 *
 * Значения по умолчанию (как у кэша): batchSize = 1000, continueRatio = 0.2.
 *
 * @code
 *   auto strategy = std::make_shared<ExpirePartial<std::string, Session>>(
 *       500,   // batchSize
 *       0.25   // continueRatio
 *   );
 * @endcode
 */
template<typename K, typename V>
class ExpirePartial : public IExpirationStrategy<K, V> {
public:
    using typename IExpirationStrategy<K, V>::Clock;
    using typename IExpirationStrategy<K, V>::TimePoint;
    using typename IExpirationStrategy<K, V>::Store;

    /// continueRatio, подставляемый вместо неположительного значения
    static constexpr double kMinContinueRatio = 0.01;

    /**
     * @brief Конструктор
     * @param batchSize Размер пакета; значения <= 0 заменяются на 1
     * @param continueRatio Доля истёкших для продолжения; <= 0 заменяется
     *        на kMinContinueRatio, > 1 обрезается до 1
     */
    explicit ExpirePartial(int64_t batchSize = 1000, double continueRatio = 0.2)
        : batchSize_(batchSize <= 0 ? 1 : static_cast<size_t>(batchSize))
        , continueRatio_(clampRatio(continueRatio))
    {}

    size_t sweep(Store& store, SweepLock& lock) override {
        if (store.size() <= batchSize_) {
            return ExpireAll<K, V>::expireAll(store, Clock::now());
        }

        size_t removed = 0;
        for (;;) {
            if (expireBatch(store, Clock::now(), removed) < continueRatio_) {
                return removed;
            }
            if (!lock.relax()) {
                return removed;
            }
        }
    }

    std::string name() const override {
        return "ExpirePartial";
    }

    size_t batchSize() const { return batchSize_; }
    double continueRatio() const { return continueRatio_; }

private:
    static double clampRatio(double ratio) {
        if (!(ratio > 0.0)) {
            return kMinContinueRatio;
        }
        return ratio > 1.0 ? 1.0 : ratio;
    }

    /**
     * @brief Обработать один пакет
     * @return Доля истёкших среди просмотренных (0 если ничего не просмотрено)
     */
    double expireBatch(Store& store, TimePoint now, size_t& removed) {
        const size_t buckets = store.bucketCount();
        if (buckets == 0) {
            return 0.0;
        }

        std::uniform_int_distribution<size_t> pick(0, buckets - 1);
        auto result = store.eraseIfFrom(pick(rng()), batchSize_,
            [now](const Entry<V>& entry) {
                return isExpired(now, entry);
            });

        removed += result.erased;
        if (result.scanned == 0) {
            return 0.0;
        }
        return static_cast<double>(result.erased) /
               static_cast<double>(result.scanned);
    }

    static std::mt19937_64& rng() {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        return engine;
    }

    size_t batchSize_;
    double continueRatio_;
};
