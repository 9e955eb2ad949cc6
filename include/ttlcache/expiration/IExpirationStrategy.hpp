#pragma once

#include <ttlcache/Entry.hpp>
#include <ttlcache/EntryStore.hpp>
#include <ttlcache/concurrency/SweepLock.hpp>
#include <cstddef>
#include <string>

/**
 * @brief Интерфейс стратегии активного истечения (фоновой очистки)
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Стратегию периодически вызывает Sweeper кэша. Ленивое истечение
 * (в get/ttl) от стратегии не зависит — оно всегда работает одинаково.
 *
 * Точки интеграции с Cache:
 * - Sweeper: вызывает sweep() раз в sweepInterval
 * - Cache::removeExpired(): ручной полный проход
 *
 * Реализации:
 * - ExpireAll — полный проход, O(n) под mutex
 * - ExpirePartial — пакетный проход с отпусканием mutex между пакетами
 *
 * @note Для решения "истекла ли запись" реализации обязаны использовать
 *       isExpired() из Entry.hpp, а не собственную логику.
 */
template<typename K, typename V>
class IExpirationStrategy {
public:
    using Clock = ExpiryTime::Clock;
    using TimePoint = ExpiryTime::TimePoint;
    using Store = EntryStore<K, V>;

    virtual ~IExpirationStrategy() = default;

    /**
     * @brief Удалить часть или все истёкшие записи
     * @param store Хранилище кэша
     * @param lock Захваченный mutex кэша
     * @return Количество удалённых записей
     *
     * Вызывается с захваченным mutex и обязана вернуть управление
     * с захваченным mutex. Если lock.relax() вернул false, кэш закрыт:
     * хранилище уже очищено и трогать его больше нельзя.
     */
    virtual size_t sweep(Store& store, SweepLock& lock) = 0;

    /**
     * @brief Название стратегии (для логов и бенчмарков)
     */
    virtual std::string name() const = 0;
};
