#pragma once

#include "ICacheListener.hpp"
#include <iostream>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша в консоль
 * @tparam K Тип ключа (должен поддерживать вывод в ostream)
 * @tparam V Тип значения
 *
 * Значения не печатаются: кэш считает их непрозрачными
 * (часто это shared_ptr на большие объекты).
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener<std::string, int>>("sessions");
 *   auto cache = Cache<std::string, int>(
 *       CacheOptions<std::string, int>().withListener(logger));
 *
 * Для отключения логирования в бенчмарках — просто не добавляем слушателя.
 */
template<typename K, typename V>
class LoggingListener : public ICacheListener<K, V> {
public:
    /**
     * @brief Конструктор
     * @param prefix Префикс для всех сообщений (например, имя кэша)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingListener(const std::string& prefix = "Cache",
                             std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onHit(const K& key) override {
        os_ << "[" << prefix_ << "] HIT: " << key << "\n";
    }

    void onMiss(const K& key) override {
        os_ << "[" << prefix_ << "] MISS: " << key << "\n";
    }

    void onInsert(const K& key, const V& value) override {
        (void)value;
        os_ << "[" << prefix_ << "] INSERT: " << key << "\n";
    }

    void onUpdate(const K& key, const V& oldValue, const V& newValue) override {
        (void)oldValue; (void)newValue;
        os_ << "[" << prefix_ << "] UPDATE: " << key << "\n";
    }

    void onExpire(const K& key) override {
        os_ << "[" << prefix_ << "] EXPIRE: " << key << "\n";
    }

    void onSweep(size_t removed, size_t remaining) override {
        os_ << "[" << prefix_ << "] SWEEP: removed " << removed
            << ", remaining " << remaining << "\n";
    }

    void onSweeperStart() override {
        os_ << "[" << prefix_ << "] SWEEPER START\n";
    }

    void onSweeperStop() override {
        os_ << "[" << prefix_ << "] SWEEPER STOP\n";
    }

    void onClose(size_t discarded) override {
        os_ << "[" << prefix_ << "] CLOSE: " << discarded << " elements\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
};
