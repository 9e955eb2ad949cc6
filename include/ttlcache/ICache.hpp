#pragma once

#include <ttlcache/Entry.hpp>
#include <optional>
#include <cstddef>

/**
 * @brief Базовый интерфейс кэша со сроком жизни записей
 * @tparam K Тип ключа
 * @tparam V Тип значения
 */
template <typename K, typename V>
class ICache
{
public:
    using Duration = ExpiryTime::Duration;

    virtual ~ICache() = default;

    /**
     * @brief Получить значение по ключу
     * @param key Ключ
     * @return Значение, если ключ существует и не истёк, иначе std::nullopt
     */
    virtual std::optional<V> get(const K &key) = 0;

    /**
     * @brief Поместить значение в кэш на время ttl
     * @param key Ключ
     * @param value Значение (пустое значение игнорируется)
     * @param ttl Время жизни (ttl <= 0 игнорируется)
     */
    virtual void setEx(const K &key, const V &value, Duration ttl) = 0;

    /**
     * @brief Поместить значение в кэш без срока жизни
     * @param key Ключ
     * @param value Значение (пустое значение игнорируется)
     */
    virtual void put(const K &key, const V &value) = 0;

    /**
     * @brief Оставшееся время жизни ключа
     * @param key Ключ
     * @return Время до истечения; std::nullopt если ключа нет или он истёк
     */
    virtual std::optional<Duration> ttl(const K &key) = 0;

    /**
     * @brief Получить текущий размер кэша
     * @return Количество записей, включая ещё не удалённые истёкшие
     */
    virtual size_t size() const = 0;

    /**
     * @brief Закрыть кэш: выбросить все записи и остановить очистку
     * @throws AlreadyClosedError при повторном вызове
     */
    virtual void close() = 0;

    /**
     * @brief Закрыт ли кэш
     */
    virtual bool isClosed() const = 0;
};
