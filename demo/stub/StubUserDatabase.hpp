#pragma once

#include "../models/UserModels.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Заглушка базы пользователей для демонстрации
 *
 * Имитирует поведение реальной БД:
 * - Задержка запроса (5-20 мс)
 * - Поиск по id и по email
 * - Пакетный запрос по списку id
 *
 * Считает запросы, чтобы демо могло показать экономию.
 */
class StubUserDatabase {
public:
    /**
     * @param simulateDelay Имитировать задержку запроса
     */
    explicit StubUserDatabase(bool simulateDelay = true)
        : simulateDelay_(simulateDelay)
        , rng_(std::random_device{}())
    {
        initializeUsers();
    }

    std::optional<User> findById(const std::string& id) {
        beginQuery();

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(id);
        if (it == users_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<User> findByEmail(const std::string& email) {
        beginQuery();

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, user] : users_) {
            if (user.email == email) {
                return user;
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Один запрос на весь список (WHERE id IN (...))
     * @return Результаты в порядке ids
     */
    std::vector<std::optional<User>> findByIds(const std::vector<std::string>& ids) {
        beginQuery();

        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::optional<User>> result;
        result.reserve(ids.size());
        for (const auto& id : ids) {
            auto it = users_.find(id);
            if (it == users_.end()) {
                result.emplace_back(std::nullopt);
            } else {
                result.emplace_back(it->second);
            }
        }
        return result;
    }

    void upsert(const User& user) {
        std::lock_guard<std::mutex> lock(mutex_);
        users_[user.id] = user;
    }

    // ==================== Статистика для демо ====================

    int getTotalQueries() const { return totalQueries_; }

    void resetStats() { totalQueries_ = 0; }

private:
    void initializeUsers() {
        users_["u-1001"] = {"u-1001", "anna@example.com", "Anna Petrova", "RU"};
        users_["u-1002"] = {"u-1002", "boris@example.com", "Boris Ivanov", "RU"};
        users_["u-1003"] = {"u-1003", "clara@example.com", "Clara Schmidt", "DE"};
        users_["u-1004"] = {"u-1004", "diego@example.com", "Diego Alvarez", "ES"};
    }

    void beginQuery() {
        ++totalQueries_;
        if (!simulateDelay_) return;

        int delayMs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::uniform_int_distribution<int> dist(5, 20);
            delayMs = dist(rng_);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delayMs));
    }

private:
    bool simulateDelay_;
    std::mt19937 rng_;
    std::atomic<int> totalQueries_{0};

    std::map<std::string, User> users_;
    mutable std::mutex mutex_;
};
