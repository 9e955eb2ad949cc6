#pragma once

#include <atomic>
#include <chrono>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

/**
 * @brief Котировка инструмента
 */
struct Quote {
    std::string ticker;
    double price = 0.0;
};

/**
 * @brief Заглушка медленного внешнего API котировок
 *
 * Имитирует:
 * - Сетевую задержку (по умолчанию 20 мс)
 * - Небольшой шум цены (±1% от базовой)
 *
 * Считает обращения, чтобы демо могло показать экономию запросов.
 */
class SlowQuoteApi {
public:
    explicit SlowQuoteApi(std::chrono::milliseconds delay = std::chrono::milliseconds(20))
        : delay_(delay)
        , rng_(std::random_device{}())
        , basePrices_{{"SBER", 300.0}, {"GAZP", 150.0}, {"LKOH", 7000.0}}
    {}

    /**
     * @throws std::runtime_error если тикер неизвестен
     */
    Quote fetch(const std::string& ticker) {
        ++totalRequests_;
        std::this_thread::sleep_for(delay_);

        auto it = basePrices_.find(ticker);
        if (it == basePrices_.end()) {
            throw std::runtime_error("Unknown ticker: " + ticker);
        }

        std::uniform_real_distribution<double> noise(-0.01, 0.01);
        return Quote{ticker, it->second * (1.0 + noise(rng_))};
    }

    int totalRequests() const { return totalRequests_; }

private:
    std::chrono::milliseconds delay_;
    std::mt19937 rng_;
    std::unordered_map<std::string, double> basePrices_;
    std::atomic<int> totalRequests_{0};
};
