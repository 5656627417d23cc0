#pragma once

#include <rcache/listeners/ICacheStoreListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики кэша
 *
 * Собирает:
 * - hits/misses/negatives: для расчёта hit rate
 * - stores/missingMarks/errors: для анализа поведения
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener>();
 *   store.addListener(stats);
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
class StatsListener : public ICacheStoreListener {
public:
    void onHit(const std::string& key) override {
        (void)key;
        ++hits_;
    }

    void onMiss(const std::string& key) override {
        (void)key;
        ++misses_;
    }

    void onNegative(const std::string& key) override {
        (void)key;
        ++negatives_;
    }

    void onStore(const std::string& key, size_t indexCount) override {
        (void)key; (void)indexCount;
        ++stores_;
    }

    void onMarkMissing(const std::string& key) override {
        (void)key;
        ++missingMarks_;
    }

    void onError(const std::string& key, const std::string& message) override {
        (void)key; (void)message;
        ++errors_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t negatives() const { return negatives_; }
    uint64_t stores() const { return stores_; }
    uint64_t missingMarks() const { return missingMarks_; }
    uint64_t errors() const { return errors_; }

    /**
     * @brief Общее количество прочитанных ключей
     */
    uint64_t totalRequests() const {
        return hits_ + misses_ + negatives_;
    }

    /**
     * @brief Доля запросов, на которые кэш ответил без источника истины (0.0 - 1.0)
     *
     * Негативный маркер тоже считается попаданием: повторный поиск в БД не нужен.
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_ + negatives_) / static_cast<double>(total);
    }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        hits_ = 0;
        misses_ = 0;
        negatives_ = 0;
        stores_ = 0;
        missingMarks_ = 0;
        errors_ = 0;
    }

private:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> negatives_{0};
    std::atomic<uint64_t> stores_{0};
    std::atomic<uint64_t> missingMarks_{0};
    std::atomic<uint64_t> errors_{0};
};
