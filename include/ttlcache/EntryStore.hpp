#pragma once

#include <ttlcache/Entry.hpp>
#include <unordered_map>
#include <vector>
#include <cstddef>
#include <utility>

/**
 * @brief Хранилище записей: ключ → (значение, момент истечения)
 * @tparam K Тип ключа (должен быть hashable для unordered_map)
 * @tparam V Тип значения
 *
 * Само по себе не потокобезопасно и ничего не знает об истечении:
 * все изменения выполняются под единственным mutex кэша,
 * а решение "удалять или нет" принимает вызывающий код.
 */
template<typename K, typename V>
class EntryStore {
public:
    using EntryType = Entry<V>;
    using Map = std::unordered_map<K, EntryType>;

    /// Результат частичного прохода по хранилищу
    struct ScanResult {
        size_t scanned = 0;
        size_t erased = 0;
    };

    /**
     * @param initialCapacity Подсказка по числу элементов (0 — без резервирования)
     */
    explicit EntryStore(size_t initialCapacity = 0) {
        if (initialCapacity > 0) {
            map_.reserve(initialCapacity);
        }
    }

    EntryType* find(const K& key) {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    const EntryType* find(const K& key) const {
        auto it = map_.find(key);
        return it == map_.end() ? nullptr : &it->second;
    }

    /**
     * @brief Вставить или перезаписать запись
     * @return true если ключ новый, false если запись перезаписана
     */
    bool set(const K& key, EntryType entry) {
        auto [it, inserted] = map_.insert_or_assign(key, std::move(entry));
        (void)it;
        return inserted;
    }

    bool erase(const K& key) {
        return map_.erase(key) > 0;
    }

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }
    size_t bucketCount() const { return map_.bucket_count(); }

    /**
     * @brief Выбросить все записи и освободить память таблицы
     * @return Сколько записей было выброшено
     */
    size_t discard() {
        size_t count = map_.size();
        Map empty;
        map_.swap(empty);
        return count;
    }

    /**
     * @brief Полный проход: удалить все записи, для которых pred == true
     * @return Количество удалённых записей
     */
    template<typename Pred>
    size_t eraseIf(Pred&& pred) {
        size_t erased = 0;
        for (auto it = map_.begin(); it != map_.end(); ) {
            if (pred(it->second)) {
                it = map_.erase(it);
                ++erased;
            } else {
                ++it;
            }
        }
        return erased;
    }

    /**
     * @brief Частичный проход: просмотреть до limit записей, начиная с корзины startBucket
     * @param startBucket Корзина, с которой начинается проход (берётся по модулю)
     * @param limit Максимум просмотренных записей
     * @param pred Удалять ли запись
     *
     * Порядок обхода — порядок корзин хэш-таблицы с переходом через конец.
     * Каждая запись просматривается не более одного раза за проход.
     */
    template<typename Pred>
    ScanResult eraseIfFrom(size_t startBucket, size_t limit, Pred&& pred) {
        ScanResult result;
        const size_t buckets = map_.bucket_count();
        if (buckets == 0 || limit == 0 || map_.empty()) {
            return result;
        }

        std::vector<K> doomed;
        for (size_t i = 0; i < buckets && result.scanned < limit; ++i) {
            const size_t bucket = (startBucket + i) % buckets;
            for (auto it = map_.cbegin(bucket);
                 it != map_.cend(bucket) && result.scanned < limit; ++it) {
                ++result.scanned;
                if (pred(it->second)) {
                    doomed.push_back(it->first);
                }
            }
        }

        // Удаляем после обхода: erase инвалидирует итераторы корзин
        for (const K& key : doomed) {
            map_.erase(key);
        }
        result.erased = doomed.size();
        return result;
    }

private:
    Map map_;
};
