#include "services/QuoteService.hpp"
#include "services/RateLimiter.hpp"
#include <ttlcache/listeners/LoggingListener.hpp>
#include <iostream>
#include <iomanip>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация TTL-кэша
 *
 * Сценарии:
 * 1. Мемоизация медленного API котировок
 * 2. Поведение TTL: ttl(), ленивое и фоновое истечение
 * 3. Ограничение частоты запросов (fixed window)
 * 4. Закрытие кэша
 */

using namespace std::chrono_literals;

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

/**
 * @brief Демо 1: Мемоизация
 *
 * 50 запросов одного тикера при TTL 5 секунд дают одно обращение к API.
 */
void demoMemoization() {
    printSeparator("Demo 1: Memoizing a Slow API");

    auto api = std::make_shared<SlowQuoteApi>();
    QuoteService service(api, 5s);

    const int requestCount = 50;
    std::cout << "Requesting SBER " << requestCount << " times...\n";

    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < requestCount; ++i) {
        auto quote = service.getQuote("SBER");
        if (i == 0) {
            std::cout << std::fixed << std::setprecision(2)
                      << "  First quote: " << quote->ticker << " " << quote->price << "\n";
        }
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    std::cout << "  Total time: " << elapsed.count() << " ms\n";
    service.printStats();
}

/**
 * @brief Демо 2: Истечение TTL
 *
 * Котировка живёт 100 мс. Показываем оставшееся время,
 * повторный запрос после истечения и работу Sweeper.
 */
void demoTtlBehavior() {
    printSeparator("Demo 2: TTL Behavior");

    auto api = std::make_shared<SlowQuoteApi>(std::chrono::milliseconds(1));
    QuoteService service(api, 100ms, 50ms);

    service.getQuote("SBER");
    service.getQuote("GAZP");
    service.getQuote("LKOH");

    if (auto left = service.freshFor("SBER")) {
        std::cout << "SBER fresh for ~"
                  << std::chrono::duration_cast<std::chrono::milliseconds>(*left).count()
                  << " ms\n";
    }
    std::cout << "Cached quotes: " << service.cachedCount() << "\n";

    std::cout << "\nWaiting 250 ms (TTL 100 ms, sweep every 50 ms)...\n";
    std::this_thread::sleep_for(250ms);

    std::cout << "Cached quotes after sweep: " << service.cachedCount() << "\n";
    std::cout << "SBER freshFor: "
              << (service.freshFor("SBER") ? "present" : "absent") << "\n";

    service.getQuote("SBER");
    std::cout << "API calls after re-request: " << api->totalRequests() << "\n";

    service.printStats();
}

/**
 * @brief Демо 3: Rate limiting
 *
 * Лимит 5 запросов на окно 200 мс для каждого клиента.
 */
void demoRateLimiter() {
    printSeparator("Demo 3: Fixed Window Rate Limiter");

    RateLimiter limiter(5, 200ms);

    std::vector<std::string> clients = {"alice", "bob"};
    for (const auto& client : clients) {
        int allowed = 0;
        int rejected = 0;
        for (int i = 0; i < 8; ++i) {
            limiter.allow(client) ? ++allowed : ++rejected;
        }
        std::cout << "  " << client << ": allowed " << allowed
                  << ", rejected " << rejected << "\n";
    }
    std::cout << "Tracked clients: " << limiter.trackedClients() << "\n";

    std::cout << "\nWaiting for the window to pass...\n";
    std::this_thread::sleep_for(250ms);

    std::cout << "  alice after window: "
              << (limiter.allow("alice") ? "allowed" : "rejected") << "\n";
}

/**
 * @brief Демо 4: Закрытие кэша
 *
 * После close() записи игнорируются, чтение возвращает промах,
 * повторный close() бросает AlreadyClosedError.
 */
void demoClose() {
    printSeparator("Demo 4: Closing the Cache");

    auto logger = std::make_shared<LoggingListener<std::string, int>>("demo");
    Cache<std::string, int> cache(CacheOptions<std::string, int>()
        .withSweepInterval(1s)
        .withListener(logger));

    cache.setEx("a", 1, 10s);
    cache.setEx("b", 2, 10s);
    cache.put("c", 3);

    cache.close();
    cache.setEx("d", 4, 10s);

    std::cout << "Size after close: " << cache.size() << "\n";
    std::cout << "get(\"a\"): " << (cache.get("a") ? "hit" : "miss") << "\n";

    try {
        cache.close();
    } catch (const AlreadyClosedError& e) {
        std::cout << "Second close(): " << e.what() << "\n";
    }
}

int main() {
    std::cout << "=== TTL Cache Demo ===\n";

    try {
        demoMemoization();
        demoTtlBehavior();
        demoRateLimiter();
        demoClose();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
