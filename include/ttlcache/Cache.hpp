#pragma once

#include <ttlcache/ICache.hpp>
#include <ttlcache/CacheErrors.hpp>
#include <ttlcache/CacheOptions.hpp>
#include <ttlcache/Entry.hpp>
#include <ttlcache/EntryStore.hpp>
#include <ttlcache/concurrency/SweepLock.hpp>
#include <ttlcache/concurrency/Sweeper.hpp>
#include <ttlcache/expiration/ExpireAll.hpp>
#include <ttlcache/expiration/IExpirationStrategy.hpp>
#include <ttlcache/listeners/ICacheListener.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Потокобезопасный кэш, в котором у каждой записи есть срок жизни
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения (хранится как есть; для больших объектов — shared_ptr)
 *
 * Архитектура:
 * - Данные хранятся в EntryStore — unordered_map<K, Entry<V>>
 * - Один mutex на весь кэш, каждая операция держит его целиком
 * - Ленивое истечение: get()/ttl() удаляют истёкшую запись при чтении
 * - Активное истечение: Sweeper раз в sweepInterval вызывает стратегию
 *   (IExpirationStrategy), чтобы брошенные ключи не копились в памяти
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Жизненный цикл Sweeper:
 * - запускается первой записью, если ещё не работает
 * - останавливается, когда видит пустой кэш или закрытый кэш
 * - в каждый момент работает не больше одного Sweeper
 *
 * Пример использования:
 * @code
 *   Cache<std::string, std::shared_ptr<Session>> sessions;
 *
 *   sessions.setEx("user:42", session, std::chrono::minutes(30));
 *   if (auto s = sessions.get("user:42")) {
 *       // ...
 *   }
 *
 *   sessions.close();
 * @endcode
 */
template<typename K, typename V>
class Cache : public ICache<K, V> {
public:
    using Clock = ExpiryTime::Clock;
    using TimePoint = ExpiryTime::TimePoint;
    using Duration = ExpiryTime::Duration;
    using Options = CacheOptions<K, V>;

    /**
     * @brief Кэш с настройками по умолчанию
     */
    Cache() : Cache(Options()) {}

    /**
     * @brief Кэш с заданными настройками
     * @param options Настройки (интервал, стратегия, ёмкость, слушатели)
     *
     * @throws std::invalid_argument если стратегия nullptr или интервал <= 0
     */
    explicit Cache(Options options)
        : store_(options.initialCapacity)
        , strategy_(std::move(options.strategy))
        , listeners_(std::move(options.listeners))
        , sweeper_(mutex_, options.sweepInterval,
                   [this](std::unique_lock<std::mutex>& lock) {
                       return sweepTick(lock);
                   })
    {
        if (!strategy_) {
            throw std::invalid_argument("Expiration strategy cannot be null");
        }
    }

    /**
     * @brief Закрывает кэш (если ещё не закрыт) и дожидается Sweeper
     */
    ~Cache() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                shutdownLocked();
            }
        }
        sweeper_.join();
    }

    Cache(const Cache&) = delete;
    Cache& operator=(const Cache&) = delete;

    /**
     * @brief Получить значение по ключу
     *
     * Логика:
     * 1. Ключа нет — nullopt
     * 2. Запись истекла — удаляем её и возвращаем nullopt
     * 3. Иначе возвращаем значение
     */
    std::optional<V> get(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = store_.find(key);
        if (!entry) {
            notifyMiss(key);
            return std::nullopt;
        }

        if (isExpired(Clock::now(), *entry)) {
            store_.erase(key);
            notifyExpire(key);
            notifyMiss(key);  // С точки зрения клиента — это miss
            return std::nullopt;
        }

        notifyHit(key);
        return entry->value;
    }

    /**
     * @brief Добавить или перезаписать значение со сроком жизни ttl
     *
     * Пустое значение и ttl <= 0 молча игнорируются.
     * На закрытом кэше запись тоже игнорируется.
     * Первая запись после простоя запускает Sweeper.
     */
    void setEx(const K& key, const V& value, Duration ttl) override {
        if (isEmptyPayload(value) || ttl <= Duration::zero()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        storeLocked(key, value, ExpiryTime::deadlineAfter(Clock::now(), ttl));
    }

    /**
     * @brief Добавить или перезаписать значение без срока жизни
     *
     * Такую запись не удаляет ни ленивое, ни активное истечение.
     */
    void put(const K& key, const V& value) override {
        if (isEmptyPayload(value)) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        storeLocked(key, value, std::nullopt);
    }

    /**
     * @brief Оставшееся время жизни ключа
     * @return Время до истечения; Duration::max() для записи без срока;
     *         nullopt если ключа нет или он истёк (истёкшая запись удаляется)
     */
    std::optional<Duration> ttl(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto* entry = store_.find(key);
        if (!entry) {
            return std::nullopt;
        }

        TimePoint now = Clock::now();
        if (!entry->expireAt.has_value()) {
            return Duration::max();
        }

        // Ровно на дедлайне остатка уже нет: запись считается истёкшей
        Duration remaining = *entry->expireAt - now;
        if (remaining <= Duration::zero()) {
            store_.erase(key);
            notifyExpire(key);
            return std::nullopt;
        }
        return remaining;
    }

    size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.size();
    }

    /**
     * @brief Закрыть кэш
     *
     * Помечает кэш закрытым, выбрасывает все записи (атомарно с флагом)
     * и будит Sweeper, чтобы тот завершился, не дожидаясь интервала.
     *
     * @throws AlreadyClosedError при повторном вызове
     */
    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw AlreadyClosedError();
        }
        size_t discarded = shutdownLocked();
        notifyClose(discarded);
    }

    bool isClosed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // ==================== Очистка ====================

    /**
     * @brief Удалить все истёкшие записи прямо сейчас
     * @return Количество удалённых записей (0 на закрытом кэше)
     *
     * Полный проход под mutex, независимо от стратегии Sweeper.
     * Полезно, если sweepInterval большой, а память нужна сейчас.
     */
    size_t removeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return 0;
        }
        size_t removed = ExpireAll<K, V>::expireAll(store_, Clock::now());
        notifySweep(removed, store_.size());
        return removed;
    }

    /**
     * @brief Работает ли сейчас Sweeper
     */
    bool isSweeperRunning() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sweeper_.running();
    }

    Duration sweepInterval() const {
        return sweeper_.interval();
    }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     */
    void addListener(std::shared_ptr<ICacheListener<K, V>> listener) {
        if (listener) {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.push_back(std::move(listener));
        }
    }

private:
    void storeLocked(const K& key, const V& value, std::optional<TimePoint> expireAt) {
        if (closed_) {
            return;
        }

        auto* existing = store_.find(key);
        std::optional<V> oldValue;
        if (existing) {
            oldValue = std::move(existing->value);
            existing->value = value;
            existing->expireAt = expireAt;
        } else {
            store_.set(key, Entry<V>{value, expireAt});
        }

        // Sweeper запускается до уведомлений: исключение слушателя
        // не должно оставить запись без активной очистки
        bool started = sweeper_.launch();

        if (oldValue) {
            notifyUpdate(key, *oldValue, value);
        } else {
            notifyInsert(key, value);
        }
        if (started) {
            notifySweeperStart();
        }
    }

    /**
     * @brief Закрыть кэш без уведомлений (общая часть close() и деструктора)
     * @return Количество выброшенных записей
     */
    size_t shutdownLocked() {
        closed_ = true;
        size_t discarded = store_.discard();
        sweeper_.wake();
        return discarded;
    }

    /**
     * @brief Один проход Sweeper (вызывается под mutex из потока Sweeper)
     * @return false если Sweeper должен завершиться
     */
    bool sweepTick(std::unique_lock<std::mutex>& lock) {
        if (closed_) {
            return false;  // О закрытии слушатели уже узнали из onClose
        }
        if (store_.empty()) {
            notifySweeperStop();
            return false;
        }

        SweepLock guard(lock, closed_);
        size_t removed = strategy_->sweep(store_, guard);
        if (!closed_) {
            notifySweep(removed, store_.size());
        }
        return true;
    }

    // ==================== Уведомления слушателей ====================

    void notifyHit(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onHit(key);
        }
    }

    void notifyMiss(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onMiss(key);
        }
    }

    void notifyInsert(const K& key, const V& value) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onInsert(key, value);
        }
    }

    void notifyUpdate(const K& key, const V& oldValue, const V& newValue) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onUpdate(key, oldValue, newValue);
        }
    }

    void notifyExpire(const K& key) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onExpire(key);
        }
    }

    void notifySweep(size_t removed, size_t remaining) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onSweep(removed, remaining);
        }
    }

    void notifySweeperStart() {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onSweeperStart();
        }
    }

    void notifySweeperStop() {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onSweeperStop();
        }
    }

    void notifyClose(size_t discarded) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            listener->onClose(discarded);
        }
    }

private:
    mutable std::mutex mutex_;
    bool closed_ = false;
    EntryStore<K, V> store_;
    std::shared_ptr<IExpirationStrategy<K, V>> strategy_;
    std::vector<std::shared_ptr<ICacheListener<K, V>>> listeners_;
    Sweeper sweeper_;
};
