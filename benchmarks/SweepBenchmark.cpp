#include <ttlcache/Cache.hpp>
#include <ttlcache/expiration/ExpireAll.hpp>
#include <ttlcache/expiration/ExpirePartial.hpp>

#include <algorithm>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <thread>
#include <vector>
#include <cstdint>
#include <memory>
#include <string>

/**
 * @brief Бенчмарк фоновой очистки
 *
 * Сравниваем задержку клиентских get/setEx, пока Sweeper чистит
 * большую таблицу с истёкшими записями:
 * 1. ExpireAll — один проход по всей таблице под mutex
 * 2. ExpirePartial — пакеты с отпусканием mutex между ними
 *
 * Полный проход блокирует клиентов на всё время сканирования,
 * пакетный ограничивает паузу размером пакета.
 */

// ==================== Утилиты ====================

using Clock = std::chrono::high_resolution_clock;
using Micros = std::chrono::duration<double, std::micro>;

struct LatencyResult {
    std::string name;
    size_t ops;
    double p50Us;
    double p99Us;
    double maxUs;
    double sweepMs;
};

void printHeader() {
    std::cout << std::left
              << std::setw(28) << "Strategy"
              << std::setw(10) << "Ops"
              << std::setw(12) << "p50 (us)"
              << std::setw(12) << "p99 (us)"
              << std::setw(14) << "max (us)"
              << std::setw(14) << "Sweep (ms)"
              << "\n";
    std::cout << std::string(90, '-') << "\n";
}

void printResult(const LatencyResult& result) {
    std::cout << std::left
              << std::setw(28) << result.name
              << std::setw(10) << result.ops
              << std::fixed << std::setprecision(1)
              << std::setw(12) << result.p50Us
              << std::setw(12) << result.p99Us
              << std::setw(14) << result.maxUs
              << std::setw(14) << result.sweepMs
              << "\n";
}

double percentile(std::vector<double>& samples, double p) {
    if (samples.empty()) {
        return 0.0;
    }
    size_t index = static_cast<size_t>(p * (samples.size() - 1));
    std::nth_element(samples.begin(), samples.begin() + index, samples.end());
    return samples[index];
}

// ==================== Бенчмарк ====================

/**
 * @brief Заполнить кэш и измерить задержку клиента во время очистки
 *
 * @param entries Сколько записей истекает одновременно
 * @param liveEntries Сколько долгоживущих записей читает клиент
 */
LatencyResult benchmarkSweep(
    std::shared_ptr<IExpirationStrategy<int, int>> strategy,
    const std::string& name,
    int entries,
    int liveEntries)
{
    Cache<int, int> cache(CacheOptions<int, int>()
        .withSweepInterval(std::chrono::milliseconds(50))
        .withStrategy(std::move(strategy))
        .withInitialCapacity(static_cast<size_t>(entries + liveEntries)));

    for (int i = 0; i < liveEntries; ++i) {
        cache.setEx(i, i, std::chrono::hours(1));
    }
    for (int i = 0; i < entries; ++i) {
        cache.setEx(liveEntries + i, i, std::chrono::milliseconds(20));
    }

    std::vector<double> samples;
    samples.reserve(1 << 20);

    auto sweepStart = Clock::now();
    auto sweepEnd = sweepStart;
    auto deadline = sweepStart + std::chrono::seconds(5);
    int key = 0;

    // Клиент работает, пока Sweeper не вычистит истёкшие записи
    while (Clock::now() < deadline) {
        auto start = Clock::now();
        if (key % 5 == 0) {
            cache.setEx(key % liveEntries, key, std::chrono::hours(1));
        } else {
            cache.get(key % liveEntries);
        }
        samples.push_back(Micros(Clock::now() - start).count());
        ++key;

        if (key % 1024 == 0 && cache.size() <= static_cast<size_t>(liveEntries)) {
            sweepEnd = Clock::now();
            break;
        }
    }

    LatencyResult result;
    result.name = name;
    result.ops = samples.size();
    result.maxUs = samples.empty() ? 0.0 : *std::max_element(samples.begin(), samples.end());
    result.p99Us = percentile(samples, 0.99);
    result.p50Us = percentile(samples, 0.50);
    result.sweepMs = std::chrono::duration<double, std::milli>(sweepEnd - sweepStart).count();
    return result;
}

void runSweepBenchmark(int entries) {
    const int LIVE_ENTRIES = 10000;

    std::cout << "\n--- " << entries << " expiring entries, "
              << LIVE_ENTRIES << " live ---\n\n";
    printHeader();

    printResult(benchmarkSweep(
        std::make_shared<ExpireAll<int, int>>(),
        "ExpireAll", entries, LIVE_ENTRIES));

    for (int64_t batch : {100, 1000, 10000}) {
        printResult(benchmarkSweep(
            std::make_shared<ExpirePartial<int, int>>(batch, 0.2),
            "ExpirePartial(" + std::to_string(batch) + ", 0.2)",
            entries, LIVE_ENTRIES));
    }
}

int main(int argc, char* argv[]) {
    std::cout << "=== TTL Cache Sweep Benchmark ===\n";
    std::cout << "Hardware threads: " << std::thread::hardware_concurrency() << "\n";

    int entries = (argc > 1) ? std::stoi(argv[1]) : 0;

    if (entries > 0) {
        runSweepBenchmark(entries);
    } else {
        runSweepBenchmark(100000);
        runSweepBenchmark(1000000);
    }

    std::cout << "\n=== Benchmark Complete ===\n";

    return 0;
}
