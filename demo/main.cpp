#include "DemoScenarios.hpp"
#include <rcache/transport/InMemoryConnection.hpp>
#include <iostream>

/**
 * @brief Демонстрация rcache на примере справочника пользователей
 *
 * Хранилище: InMemoryConnection, внешний сервер не нужен.
 * Тот же набор сценариев против Redis: rcache_redis_demo.
 */

int main() {
    std::cout << "=== rcache Demo: User Directory ===\n";
    std::cout << "Read-through caching with an in-memory store\n";

    try {
        ConnectionRegistry registry([](const ServerConfig&) -> std::shared_ptr<IConnection> {
            return std::make_shared<InMemoryConnection>();
        });

        runAllDemos(registry, ServerConfig{});

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
