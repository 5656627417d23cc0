#pragma once

#include "../models/UserModels.hpp"
#include "../stub/StubUserDatabase.hpp"
#include <rcache/CacheStore.hpp>
#include <rcache/ConnectionRegistry.hpp>
#include <rcache/listeners/LoggingListener.hpp>
#include <rcache/listeners/StatsListener.hpp>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

/**
 * @brief Справочник пользователей с read-through кэшем
 *
 * Демонстрирует практическое применение CacheStore.
 *
 * Стратегия:
 * - Found   : отдаём из кэша
 * - Negative: пользователя нет, в БД не идём
 * - Absent  : идём в БД; найденного сохраняем, ненайденного помечаем
 *
 * Поиск по email идёт через вторичный индекс "by_email": одна операция
 * вместо двух GET (email -> id -> запись).
 */
class UserDirectoryService {
public:
    static constexpr const char* BY_EMAIL = "by_email";

    /**
     * @param db База пользователей (реальная или заглушка)
     * @param registry Реестр соединений; кэши одного сервера делят соединение
     * @param config Настройки кэша; индекс by_email добавляется, если его нет
     * @param log Поток для LoggingListener; nullptr: без логирования
     */
    UserDirectoryService(std::shared_ptr<StubUserDatabase> db,
                         ConnectionRegistry& registry,
                         CacheConfig config,
                         std::ostream* log = nullptr)
        : db_(std::move(db))
        , cache_(withEmailIndex(std::move(config)), registry, std::make_shared<UserCodec>())
        , stats_(std::make_shared<StatsListener>())
    {
        cache_.addListener(stats_);
        if (log) {
            cache_.addListener(std::make_shared<LoggingListener>("users", *log));
        }
    }

    /**
     * @brief Получить пользователя по id
     */
    std::optional<User> getUser(const std::string& id) {
        auto cached = cache_.fetch(id);
        if (cached.isFound()) {
            return cached.value();
        }
        if (cached.isNegative()) {
            return std::nullopt;
        }

        // Кэш-промах, запрашиваем БД
        auto user = db_->findById(id);
        remember(id, user);
        return user;
    }

    /**
     * @brief Получить пользователя по email
     */
    std::optional<User> findByEmail(const std::string& email) {
        auto cached = cache_.fetch(IndexTuple{email}, BY_EMAIL);
        if (cached.isFound()) {
            return cached.value();
        }
        if (cached.isNegative()) {
            return std::nullopt;
        }

        // Несуществующий email не кэшируем: маркер ставится только на id
        auto user = db_->findByEmail(email);
        if (user) {
            cache_.store(user->id, *user);
        }
        return user;
    }

    /**
     * @brief Получить пользователей пачкой
     *
     * Один round trip к кэшу, затем один запрос к БД только по промахам.
     */
    std::vector<std::optional<User>> getUsers(const std::vector<std::string>& ids) {
        auto cached = cache_.fetchMany(ids);

        std::vector<std::optional<User>> result(ids.size());
        std::vector<std::string> missedIds;
        std::vector<size_t> missedPositions;

        for (size_t i = 0; i < ids.size(); ++i) {
            if (cached[i].isFound()) {
                result[i] = cached[i].value();
            } else if (cached[i].isAbsent()) {
                missedIds.push_back(ids[i]);
                missedPositions.push_back(i);
            }
        }

        if (missedIds.empty()) {
            return result;
        }

        auto loaded = db_->findByIds(missedIds);
        std::vector<std::string> notFound;
        for (size_t i = 0; i < loaded.size(); ++i) {
            if (loaded[i]) {
                cache_.store(missedIds[i], *loaded[i]);
                result[missedPositions[i]] = loaded[i];
            } else {
                notFound.push_back(missedIds[i]);
            }
        }
        cache_.addMissing(notFound);
        return result;
    }

    /**
     * @brief Обновить пользователя в БД и в кэше
     */
    void updateUser(const User& user) {
        db_->upsert(user);
        cache_.store(user.id, user);
    }

    // ==================== Статистика ====================

    void printStats() const {
        std::cout << "\n=== UserDirectoryService Statistics ===\n\n";

        std::cout << "User Cache:\n";
        std::cout << "  Hits:      " << stats_->hits() << "\n";
        std::cout << "  Negatives: " << stats_->negatives() << "\n";
        std::cout << "  Misses:    " << stats_->misses() << "\n";
        std::cout << "  Stores:    " << stats_->stores() << "\n";
        std::cout << "  Hit Rate:  " << std::fixed << std::setprecision(1)
                  << (stats_->hitRate() * 100) << "%\n\n";

        std::cout << "Database Statistics:\n";
        std::cout << "  Total Queries: " << db_->getTotalQueries() << "\n";
    }

    void resetStats() {
        stats_->reset();
        db_->resetStats();
    }

    StubUserDatabase& db() { return *db_; }

    const CacheStore<User>& cache() const { return cache_; }

private:
    static CacheConfig withEmailIndex(CacheConfig config) {
        for (const auto& def : config.indexes) {
            if (def.name == BY_EMAIL) {
                return config;
            }
        }
        config.indexes.emplace_back(BY_EMAIL, "email");
        return config;
    }

    void remember(const std::string& id, const std::optional<User>& user) {
        if (user) {
            cache_.store(id, *user);
        } else {
            cache_.addMissing(id);
        }
    }

private:
    std::shared_ptr<StubUserDatabase> db_;
    CacheStore<User> cache_;
    std::shared_ptr<StatsListener> stats_;
};
