#pragma once

#include "ICacheStoreListener.hpp"
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Слушатель для логирования событий кэша в поток
 *
 * Использование:
 *   auto logger = std::make_shared<LoggingListener>("users");
 *   store.addListener(logger);
 *
 * Строки пишутся под mutex_, чтобы вывод из разных потоков не перемешивался.
 */
class LoggingListener : public ICacheStoreListener {
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

    void onHit(const std::string& key) override {
        write("HIT: " + key);
    }

    void onMiss(const std::string& key) override {
        write("MISS: " + key);
    }

    void onNegative(const std::string& key) override {
        write("NEGATIVE: " + key);
    }

    void onStore(const std::string& key, size_t indexCount) override {
        write("STORE: " + key + " (" + std::to_string(indexCount) + " index(es))");
    }

    void onMarkMissing(const std::string& key) override {
        write("MARK MISSING: " + key);
    }

    void onError(const std::string& key, const std::string& message) override {
        write("ERROR: " + key + " (" + message + ")");
    }

private:
    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << line << "\n";
    }

private:
    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
