#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <cstddef>
#include <type_traits>

/**
 * @brief Типы времени, общие для всего кэша
 *
 * Используются монотонные часы: перевод системного времени
 * не должен влиять на сроки жизни записей.
 */
struct ExpiryTime {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;

    /**
     * @brief Момент истечения now + ttl с насыщением
     *
     * Огромный TTL не должен переполнять time_point, поэтому
     * результат ограничивается TimePoint::max().
     */
    static TimePoint deadlineAfter(TimePoint now, Duration ttl) {
        if (ttl > TimePoint::max() - now) {
            return TimePoint::max();
        }
        return now + ttl;
    }
};

/**
 * @brief Запись хранилища: значение + абсолютный момент истечения
 * @tparam V Тип значения (непрозрачен для кэша)
 *
 * expireAt == nullopt означает "никогда не истекает".
 */
template<typename V>
struct Entry {
    V value;
    std::optional<ExpiryTime::TimePoint> expireAt;
};

/**
 * @brief Истекла ли запись на момент now
 *
 * Единственный предикат истечения: его используют и ленивое удаление
 * в get()/ttl(), и фоновые стратегии очистки.
 * Запись без срока не истекает никогда; запись со сроком истекает
 * строго после expireAt.
 */
template<typename V>
inline bool isExpired(ExpiryTime::TimePoint now, const Entry<V>& entry) {
    return entry.expireAt.has_value() && now > *entry.expireAt;
}

namespace detail {

template<typename V>
struct IsNullable : std::is_pointer<V> {};

template<typename T>
struct IsNullable<std::shared_ptr<T>> : std::true_type {};

template<typename T, typename D>
struct IsNullable<std::unique_ptr<T, D>> : std::true_type {};

template<typename Signature>
struct IsNullable<std::function<Signature>> : std::true_type {};

template<typename V>
struct IsOptional : std::false_type {};

template<typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

} // namespace detail

/**
 * @brief Пустое ли значение (такое не сохраняется в кэш)
 *
 * - указатели, умные указатели, std::function: пусто, если == nullptr
 * - std::optional: пусто, если нет значения
 * - остальные типы пустыми не бывают (пустая строка — обычное значение)
 */
template<typename V>
inline bool isEmptyPayload(const V& value) {
    if constexpr (detail::IsOptional<V>::value) {
        return !value.has_value();
    } else if constexpr (detail::IsNullable<V>::value) {
        return value == nullptr;
    } else {
        (void)value;
        return false;
    }
}
