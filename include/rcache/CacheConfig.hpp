#pragma once

#include <rcache/Errors.hpp>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <tuple>
#include <unordered_set>
#include <vector>

/**
 * @brief Идентичность сервера хранилища
 *
 * Ключ дедупликации соединений в ConnectionRegistry. Таймауты сюда
 * не входят: два кэша с разными таймаутами к одному серверу всё равно
 * делят одно соединение.
 */
struct ServerIdentity {
    std::string host = "localhost";
    uint16_t port = 6379;
    int db = 0;

    std::string toString() const {
        return host + ":" + std::to_string(port) + "/" + std::to_string(db);
    }

    bool operator==(const ServerIdentity& other) const {
        return host == other.host && port == other.port && db == other.db;
    }

    bool operator!=(const ServerIdentity& other) const {
        return !(*this == other);
    }

    bool operator<(const ServerIdentity& other) const {
        return std::tie(host, port, db) < std::tie(other.host, other.port, other.db);
    }
};

/**
 * @brief Параметры подключения к серверу
 */
struct ServerConfig {
    ServerIdentity identity;
    std::chrono::milliseconds connectTimeout{2000};
    std::chrono::milliseconds commandTimeout{2000};
};

/**
 * @brief Описание вторичного индекса: имя и упорядоченный список полей записи
 *
 * Одиночное поле нормализуется в список из одного элемента:
 * @code
 *   IndexDefinition byEmail("by_email", "email");
 *   IndexDefinition byName("by_name", {"first", "last"});
 * @endcode
 */
struct IndexDefinition {
    std::string name;
    std::vector<std::string> fields;

    IndexDefinition() = default;

    IndexDefinition(std::string indexName, std::string field)
        : name(std::move(indexName))
        , fields{std::move(field)}
    {}

    IndexDefinition(std::string indexName, std::vector<std::string> indexFields)
        : name(std::move(indexName))
        , fields(std::move(indexFields))
    {}

    IndexDefinition(std::string indexName, std::initializer_list<std::string> indexFields)
        : name(std::move(indexName))
        , fields(indexFields)
    {}
};

/**
 * @brief Конфигурация экземпляра CacheStore
 *
 * ttl == 0: записи хранятся бессрочно. TTL один на экземпляр
 * и применяется к основным записям, индексам и негативным маркерам.
 */
struct CacheConfig {
    std::chrono::seconds ttl{0};
    ServerConfig server;
    std::vector<IndexDefinition> indexes;

    /**
     * @brief Проверить конфигурацию
     * @throws ConfigurationError с путём до проблемного поля
     */
    void validate() const {
        if (ttl < std::chrono::seconds::zero()) {
            throw ConfigurationError("ttl", "must be a non-negative number of seconds");
        }
        if (server.identity.host.empty()) {
            throw ConfigurationError("server.host", "must not be empty");
        }
        if (server.identity.port == 0) {
            throw ConfigurationError("server.port", "must be in range 1-65535");
        }
        if (server.identity.db < 0) {
            throw ConfigurationError("server.db", "must be non-negative");
        }
        validateIndexes(indexes);
    }

    /**
     * @brief Проверить список индексов (используется также IndexCatalog)
     */
    static void validateIndexes(const std::vector<IndexDefinition>& definitions) {
        std::unordered_set<std::string> seen;
        for (size_t i = 0; i < definitions.size(); ++i) {
            const auto& def = definitions[i];
            const std::string path = "indexes[" + std::to_string(i) + "]";

            if (def.name.empty()) {
                throw ConfigurationError(path + ".name", "is required");
            }
            if (def.fields.empty()) {
                throw ConfigurationError(path + ".fields", "is required");
            }
            for (const auto& field : def.fields) {
                if (field.empty()) {
                    throw ConfigurationError(path + ".fields",
                        "field names must be non-empty strings");
                }
            }
            if (!seen.insert(def.name).second) {
                throw ConfigurationError(path + ".name",
                    "duplicate index \"" + def.name + "\"");
            }
        }
    }
};
