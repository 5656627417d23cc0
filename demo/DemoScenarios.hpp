#pragma once

#include "services/UserDirectoryService.hpp"
#include <iostream>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Сценарии демо справочника пользователей
 *
 * Не зависят от транспорта: соединение берётся из переданного реестра
 * (InMemoryConnection в main.cpp, Redis в redis_main.cpp).
 *
 * Сценарии:
 * 1. Экономия запросов к БД
 * 2. Негативное кэширование отсутствующих пользователей
 * 3. Поиск по email через вторичный индекс
 * 4. Пакетное чтение
 * 5. TTL и устаревание данных
 * 6. Общее соединение для нескольких кэшей
 */

inline void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

inline void printUser(const std::optional<User>& user) {
    if (!user) {
        std::cout << "  <not found>\n";
        return;
    }
    std::cout << "  " << user->id << ": " << user->name
              << " <" << user->email << ">, " << user->country << "\n";
}

inline CacheConfig demoConfig(const ServerConfig& server, std::chrono::seconds ttl) {
    CacheConfig config;
    config.server = server;
    config.ttl = ttl;
    return config;
}

/**
 * @brief Демо 1: Экономия запросов к БД
 *
 * Без кэша 50 запросов = 50 обращений к БД.
 * С кэшем 50 запросов = 1 обращение к БД.
 */
inline void demoDatabaseSavings(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 1: Database Query Savings");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService service(db, registry, demoConfig(server, std::chrono::seconds(60)));

    const int requestCount = 50;
    std::cout << "Requesting user u-1001 " << requestCount << " times...\n\n";

    for (int i = 0; i < requestCount; ++i) {
        auto user = service.getUser("u-1001");
        if (i == 0) {
            std::cout << "First request (database query):\n";
            printUser(user);
        }
    }

    service.printStats();

    std::cout << "\nResult: " << requestCount << " lookups, but only "
              << db->getTotalQueries() << " database query(ies)!\n";
}

/**
 * @brief Демо 2: Негативное кэширование
 *
 * Несуществующий id помечается в кэше, повторные запросы не доходят до БД.
 */
inline void demoNegativeCaching(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 2: Negative Caching");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService service(db, registry, demoConfig(server, std::chrono::seconds(60)),
                                 &std::cout);

    std::cout << "Looking up unknown user u-9999 three times:\n\n";
    for (int i = 0; i < 3; ++i) {
        printUser(service.getUser("u-9999"));
    }

    std::cout << "\nDatabase queries: " << db->getTotalQueries()
              << " (the rest answered by the negative marker)\n";
}

/**
 * @brief Демо 3: Поиск по email
 *
 * Индекс by_email -> id разрешается на сервере одним скриптом.
 */
inline void demoEmailIndex(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 3: Secondary Index Lookup");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService service(db, registry, demoConfig(server, std::chrono::seconds(60)));

    std::cout << "Warm cache by id:\n";
    printUser(service.getUser("u-1003"));

    std::cout << "\nLookup by email (from cache via index):\n";
    printUser(service.findByEmail("clara@example.com"));

    std::cout << "\nDatabase queries: " << db->getTotalQueries() << "\n";

    std::cout << "\nEmail changed, cache updated:\n";
    User clara = *service.getUser("u-1003");
    clara.email = "clara.schmidt@example.com";
    service.updateUser(clara);
    printUser(service.findByEmail("clara.schmidt@example.com"));

    std::cout << "\nDatabase queries: " << db->getTotalQueries() << " (unchanged)\n";
}

/**
 * @brief Демо 4: Пакетное чтение
 *
 * Один round trip к кэшу, один запрос к БД по промахам.
 */
inline void demoBatchLookup(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 4: Batch Lookup");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService service(db, registry, demoConfig(server, std::chrono::seconds(60)));

    std::vector<std::string> ids = {"u-1001", "u-1002", "u-0000", "u-1004"};

    std::cout << "First batch (cold cache):\n";
    for (const auto& user : service.getUsers(ids)) {
        printUser(user);
    }
    std::cout << "  Database queries: " << db->getTotalQueries() << "\n\n";

    std::cout << "Second batch (warm cache):\n";
    for (const auto& user : service.getUsers(ids)) {
        printUser(user);
    }
    std::cout << "  Database queries: " << db->getTotalQueries() << " (unchanged)\n";

    service.printStats();
}

/**
 * @brief Демо 5: TTL
 *
 * - Первый запрос: из БД
 * - Повторный в течение TTL: из кэша
 * - После истечения TTL: снова из БД
 */
inline void demoTtlBehavior(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 5: TTL Behavior");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService service(db, registry, demoConfig(server, std::chrono::seconds(1)));

    std::cout << "User TTL set to 1s\n\n";

    std::cout << "Request 1 (t=0ms):\n";
    printUser(service.getUser("u-1002"));
    std::cout << "  Database queries: " << db->getTotalQueries() << "\n\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::cout << "Request 2 (t=300ms, within TTL):\n";
    printUser(service.getUser("u-1002"));
    std::cout << "  Database queries: " << db->getTotalQueries() << " (from cache)\n\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
    std::cout << "Request 3 (t=1300ms, TTL expired):\n";
    printUser(service.getUser("u-1002"));
    std::cout << "  Database queries: " << db->getTotalQueries() << " (fresh from database)\n";
}

/**
 * @brief Демо 6: Общее соединение
 *
 * Два кэша с разными TTL на одном сервере используют одно соединение.
 */
inline void demoSharedConnection(ConnectionRegistry& registry, const ServerConfig& server) {
    printSeparator("Demo 6: Shared Connection");

    auto db = std::make_shared<StubUserDatabase>(false);
    UserDirectoryService shortLived(db, registry, demoConfig(server, std::chrono::seconds(5)));
    UserDirectoryService longLived(db, registry, demoConfig(server, std::chrono::seconds(3600)));

    std::cout << "Two caches on " << server.identity.toString() << "\n";
    std::cout << "  Same connection: "
              << (shortLived.cache().connection() == longLived.cache().connection() ? "yes" : "no")
              << "\n";
    std::cout << "  Connections in registry: " << registry.size() << "\n";
}

/**
 * @brief Запустить все сценарии
 *
 * Сценарии пишут одни и те же id, поэтому каждому достаётся своя база:
 * server.identity.db, db + 1, ... Реестр создаёт по соединению на базу.
 */
inline void runAllDemos(ConnectionRegistry& registry, const ServerConfig& server) {
    auto database = [&server](int offset) {
        ServerConfig result = server;
        result.identity.db = server.identity.db + offset;
        return result;
    };

    demoDatabaseSavings(registry, database(0));
    demoNegativeCaching(registry, database(1));
    demoEmailIndex(registry, database(2));
    demoBatchLookup(registry, database(3));
    demoTtlBehavior(registry, database(4));
    demoSharedConnection(registry, database(5));

    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  Demo Complete!\n";
    std::cout << std::string(60, '=') << "\n";
}
