#include "DemoScenarios.hpp"
#include <rcache/transport/RedisConnection.hpp>
#include <iostream>
#include <string>

/**
 * @brief Демо справочника пользователей против живого Redis
 *
 * Использование: rcache_redis_demo [host] [port] [db]
 * По умолчанию localhost 6379 10. Сценарии занимают базы db..db+5.
 */

int main(int argc, char** argv) {
    ServerConfig server;
    server.identity.db = 10;

    try {
        if (argc > 1) server.identity.host = argv[1];
        if (argc > 2) server.identity.port = static_cast<uint16_t>(std::stoi(argv[2]));
        if (argc > 3) server.identity.db = std::stoi(argv[3]);
    } catch (const std::exception&) {
        std::cerr << "Usage: " << argv[0] << " [host] [port] [db]\n";
        return 2;
    }

    std::cout << "=== rcache Demo: User Directory ===\n";
    std::cout << "Read-through caching with Redis at " << server.identity.toString() << "\n";

    try {
        ConnectionRegistry registry([](const ServerConfig& config) -> std::shared_ptr<IConnection> {
            return RedisConnection::connect(config);
        });

        runAllDemos(registry, server);

    } catch (const TransportError& e) {
        std::cerr << "Redis error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
