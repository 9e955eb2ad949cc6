#pragma once

#include "IExpirationStrategy.hpp"

/**
 * @brief Полный проход: проверить каждую запись и удалить истёкшие
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Все записи сравниваются с одним моментом now, взятым в начале прохода.
 * mutex удерживается весь проход, поэтому на больших таблицах
 * get/setEx других потоков ждут его окончания.
 *
 * @code
 *   auto options = CacheOptions<std::string, int>()
 *       .withStrategy(std::make_shared<ExpireAll<std::string, int>>());
 * @endcode
 */
template<typename K, typename V>
class ExpireAll : public IExpirationStrategy<K, V> {
public:
    using typename IExpirationStrategy<K, V>::Clock;
    using typename IExpirationStrategy<K, V>::TimePoint;
    using typename IExpirationStrategy<K, V>::Store;

    size_t sweep(Store& store, SweepLock& lock) override {
        (void)lock;  // Не отпускает mutex
        return expireAll(store, Clock::now());
    }

    std::string name() const override {
        return "ExpireAll";
    }

    /**
     * @brief Удалить все записи, истёкшие на момент now
     * @return Количество удалённых записей
     */
    static size_t expireAll(Store& store, TimePoint now) {
        return store.eraseIf([now](const Entry<V>& entry) {
            return isExpired(now, entry);
        });
    }
};
