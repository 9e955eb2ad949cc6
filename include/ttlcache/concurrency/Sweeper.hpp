#pragma once

#include <ttlcache/Entry.hpp>
#include <condition_variable>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

/**
 * @brief Фоновый поток периодической очистки кэша
 *
 * Состояния: Idle → Waiting ⇄ Sweeping → Terminated (и снова Idle).
 * - launch(): Idle → Waiting, запускает поток
 * - таймер sweepInterval или wake(): Waiting → Sweeping
 * - tick() вернул false: Sweeping → Terminated, поток завершается
 * - tick() вернул true: Sweeping → Waiting, таймер заводится заново
 * - tick() бросил исключение: ошибка пишется в std::cerr, Sweeping → Waiting
 *
 * Sweeper не имеет своего mutex: он ждёт на condition_variable
 * под mutex кэша, поэтому tick() всегда вызывается с захваченным mutex.
 *
 * Сигнал wake() одноместный: повторный сигнал, пока предыдущий
 * не получен, теряется, а не ставится в очередь.
 *
 * Все методы, кроме join(), вызываются под mutex кэша.
 *
 * @code
 *   std::mutex mutex;
 *   Sweeper sweeper(mutex, std::chrono::seconds(10),
 *       [&](std::unique_lock<std::mutex>& lock) {
 *           return doSweep(lock);  // false — остановиться
 *       });
 *
 *   std::lock_guard<std::mutex> guard(mutex);
 *   sweeper.launch();
 * @endcode
 */
class Sweeper {
public:
    using Clock = ExpiryTime::Clock;
    using Duration = ExpiryTime::Duration;

    /// Один проход очистки; false — завершить поток
    using Tick = std::function<bool(std::unique_lock<std::mutex>&)>;

    /**
     * @param mutex mutex кэша, под которым живёт всё состояние
     * @param interval Интервал между проходами (должен быть > 0)
     * @param tick Проход очистки
     */
    Sweeper(std::mutex& mutex, Duration interval, Tick tick)
        : mutex_(mutex)
        , interval_(interval)
        , tick_(std::move(tick))
    {
        if (interval_ <= Duration::zero()) {
            throw std::invalid_argument("Sweep interval must be positive");
        }
        if (!tick_) {
            throw std::invalid_argument("Sweep tick cannot be empty");
        }
    }

    ~Sweeper() {
        join();
    }

    Sweeper(const Sweeper&) = delete;
    Sweeper& operator=(const Sweeper&) = delete;

    /**
     * @brief Запустить поток, если он ещё не работает
     * @return true если поток запущен этим вызовом
     */
    bool launch() {
        if (running_) {
            return false;
        }
        // Предыдущий поток уже сбросил running_ под mutex и только выходит
        if (thread_.joinable()) {
            thread_.join();
        }
        running_ = true;
        wakePending_ = false;
        thread_ = std::thread(&Sweeper::run, this);
        return true;
    }

    /**
     * @brief Разбудить поток, не дожидаясь таймера
     */
    void wake() {
        if (!running_ || wakePending_) {
            return;
        }
        wakePending_ = true;
        wakeup_.notify_one();
    }

    bool running() const {
        return running_;
    }

    Duration interval() const {
        return interval_;
    }

    /**
     * @brief Дождаться завершения потока
     *
     * Вызывается без mutex и только когда новых launch() уже не будет
     * (кэш закрыт), иначе ожидание может длиться до следующего интервала.
     */
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            auto deadline = ExpiryTime::deadlineAfter(Clock::now(), interval_);
            wakeup_.wait_until(lock, deadline, [this] { return wakePending_; });
            wakePending_ = false;

            bool keepGoing = true;
            try {
                keepGoing = tick_(lock);
            } catch (const std::exception& e) {
                std::cerr << "[Sweeper] Sweep error: " << e.what() << std::endl;
            } catch (...) {
                std::cerr << "[Sweeper] Unknown sweep error" << std::endl;
            }
            // tick() мог бросить между unlock() и lock() в SweepLock::relax()
            if (!lock.owns_lock()) {
                lock.lock();
            }

            if (!keepGoing) {
                running_ = false;
                return;
            }
        }
    }

    std::mutex& mutex_;
    std::condition_variable wakeup_;
    Duration interval_;
    Tick tick_;
    bool running_ = false;
    bool wakePending_ = false;
    std::thread thread_;
};
