#pragma once

#include <cstddef>
#include <mutex>
#include <thread>

/**
 * @brief Удерживаемый mutex кэша, переданный стратегии очистки
 *
 * Стратегия вызывается с уже захваченным mutex. Через SweepLock
 * она может временно отпустить его между пакетами, чтобы get/setEx
 * других потоков не ждали окончания всего прохода.
 *
 * Контракт:
 * - на выходе из стратегии mutex снова захвачен
 * - после relax(), вернувшего false, кэш закрыт и стратегия
 *   должна немедленно завершиться
 *
 * @code
 *   while (needMoreWork()) {
 *       doBatch(store);
 *       if (!guard.relax()) {
 *           return;  // кэш закрыли, пока mutex был отпущен
 *       }
 *   }
 * @endcode
 */
class SweepLock {
public:
    /**
     * @param lock Захваченный mutex кэша
     * @param closed Флаг закрытия кэша (читается только под mutex)
     */
    SweepLock(std::unique_lock<std::mutex>& lock, const bool& closed)
        : lock_(lock)
        , closed_(closed)
    {}

    SweepLock(const SweepLock&) = delete;
    SweepLock& operator=(const SweepLock&) = delete;

    /**
     * @brief Отпустить mutex, уступить процессор и захватить mutex снова
     * @return false если за это время кэш был закрыт
     */
    bool relax() {
        lock_.unlock();
        std::this_thread::yield();
        lock_.lock();
        ++relaxations_;
        return !closed_;
    }

    bool closed() const {
        return closed_;
    }

    /// Сколько раз стратегия отпускала mutex за этот проход
    size_t relaxations() const {
        return relaxations_;
    }

private:
    std::unique_lock<std::mutex>& lock_;
    const bool& closed_;
    size_t relaxations_ = 0;
};
