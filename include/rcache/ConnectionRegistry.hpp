#pragma once

#include <rcache/CacheConfig.hpp>
#include <rcache/transport/IConnection.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>

/**
 * @brief Реестр соединений: одно соединение на ServerIdentity
 *
 * Несколько CacheStore, настроенных на один сервер (host, port, db),
 * получают один и тот же объект соединения.
 *
 * Потокобезопасность: у каждой identity свой слот со своим мьютексом.
 * connect вызывается под мьютексом слота, поэтому при одновременном первом
 * обращении к одной identity соединение создаётся ровно один раз, а
 * медленное подключение к одному серверу не задерживает остальные.
 * Общий mutex_ держится только на время поиска слота, так что connect
 * может обращаться к реестру за соединением с другой identity.
 * Если connect бросает исключение, в реестре ничего не сохраняется и
 * следующий вызов попробует снова.
 *
 * Использование:
 * @code
 *   ConnectionRegistry registry(
 *       [](const ServerConfig& server) { return RedisConnection::connect(server); });
 *
 *   CacheStore<FieldMap> users(usersConfig, registry, codec);
 *   CacheStore<FieldMap> orders(ordersConfig, registry, codec);  // то же соединение
 * @endcode
 */
class ConnectionRegistry {
public:
    using Connect = std::function<std::shared_ptr<IConnection>()>;
    using ConnectionFactory = std::function<std::shared_ptr<IConnection>(const ServerConfig&)>;

    ConnectionRegistry() = default;

    /**
     * @param factory Фабрика для getOrCreate(const ServerConfig&)
     */
    explicit ConnectionRegistry(ConnectionFactory factory)
        : factory_(std::move(factory))
    {}

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Получить соединение для identity или создать его через connect
     * @throws std::invalid_argument если connect пуст или вернул nullptr
     */
    std::shared_ptr<IConnection> getOrCreate(const ServerIdentity& identity,
                                             const Connect& connect) {
        std::shared_ptr<Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto& entry = slots_[identity];
            if (!entry) {
                entry = std::make_shared<Slot>();
            }
            slot = entry;
        }

        std::lock_guard<std::mutex> slotLock(slot->mutex);
        if (slot->connection) {
            return slot->connection;
        }

        if (!connect) {
            throw std::invalid_argument("Connect function cannot be null");
        }

        std::shared_ptr<IConnection> connection = connect();
        if (!connection) {
            throw std::invalid_argument(
                "Connect function returned null for " + identity.toString());
        }

        slot->connection = connection;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connections_.emplace(identity, connection);
        }
        return connection;
    }

    /**
     * @brief Получить соединение через фабрику реестра
     * @throws std::logic_error если реестр создан без фабрики
     */
    std::shared_ptr<IConnection> getOrCreate(const ServerConfig& server) {
        if (!factory_) {
            throw std::logic_error("ConnectionRegistry has no connection factory");
        }
        return getOrCreate(server.identity, [&]() { return factory_(server); });
    }

    /**
     * @brief Уже созданное соединение (без создания)
     */
    std::shared_ptr<IConnection> find(const ServerIdentity& identity) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(identity);
        return it == connections_.end() ? nullptr : it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

private:
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<IConnection> connection;
    };

    ConnectionFactory factory_;
    std::map<ServerIdentity, std::shared_ptr<Slot>> slots_;
    std::map<ServerIdentity, std::shared_ptr<IConnection>> connections_;
    mutable std::mutex mutex_;
};
