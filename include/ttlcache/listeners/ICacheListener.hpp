#pragma once

#include <cstddef>


/**
 * @brief Интерфейс слушателя событий кэша
 * @tparam K Тип ключа
 * @tparam V Тип значения
 *
 * Вызывается под mutex кэша: из потока, выполняющего операцию,
 * или из потока Sweeper (onSweep, onSweeperStop).
 */
template<typename K, typename V>
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(const K& key) { (void)key; }
    virtual void onMiss(const K& key) { (void)key; }
    virtual void onInsert(const K& key, const V& value) { (void)key; (void)value; }
    virtual void onUpdate(const K& key, const V& oldValue, const V& newValue) {
        (void)key; (void)oldValue; (void)newValue;
    }
    /// Ленивое истечение: запись удалена при чтении
    virtual void onExpire(const K& key) { (void)key; }
    /// Активное истечение: проход стратегии удалил removed записей
    virtual void onSweep(size_t removed, size_t remaining) { (void)removed; (void)remaining; }
    virtual void onSweeperStart() {}
    /// Sweeper остановился, потому что кэш опустел (при close() не вызывается)
    virtual void onSweeperStop() {}
    virtual void onClose(size_t discarded) { (void)discarded; }
};
