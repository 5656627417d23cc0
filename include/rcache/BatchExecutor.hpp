#pragma once

#include <rcache/Errors.hpp>
#include <rcache/transport/IConnection.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Построитель и исполнитель pipeline
 *
 * Накапливает операции и отправляет их одним round trip.
 * Ответы возвращаются в порядке добавления операций.
 *
 * @code
 *   BatchExecutor batch(connection);
 *   batch.set("u1", encoded, ttl).set("by_email:a@b.com", "u1", ttl);
 *   auto replies = batch.execute();
 * @endcode
 *
 * @note Pipeline означает "отправить вместе", а не "зафиксировать вместе".
 *       При обрыве соединения посреди пакета часть записей может
 *       оказаться применённой.
 *
 * Экземпляр не потокобезопасен: создаётся на один вызов.
 */
class BatchExecutor {
public:
    explicit BatchExecutor(std::shared_ptr<IConnection> connection)
        : connection_(std::move(connection))
    {
        if (!connection_) {
            throw std::invalid_argument("Connection cannot be null");
        }
    }

    BatchExecutor& get(const std::string& key) {
        ops_.push_back(Operation::get(key));
        return *this;
    }

    BatchExecutor& set(const std::string& key, const std::string& value,
                       std::chrono::seconds ttl) {
        ops_.push_back(Operation::set(key, value, ttl));
        return *this;
    }

    /**
     * @param script Должен жить до вызова execute()
     */
    BatchExecutor& eval(const LuaScript& script, const std::vector<std::string>& keys) {
        ops_.push_back(Operation::eval(script, keys));
        return *this;
    }

    size_t size() const { return ops_.size(); }
    bool empty() const { return ops_.empty(); }

    const std::vector<Operation>& operations() const { return ops_; }

    /**
     * @brief Выполнить накопленные операции одним round trip
     * @return Ответы в порядке операций; пустой пакет не обращается к сети
     * @throws TransportError при сбое или если число ответов не совпало
     */
    std::vector<RawValue> execute() {
        if (ops_.empty()) {
            return {};
        }

        std::vector<Operation> ops;
        ops.swap(ops_);

        std::vector<RawValue> replies = connection_->pipeline(ops);
        if (replies.size() != ops.size()) {
            throw TransportError("Pipeline returned " + std::to_string(replies.size()) +
                                 " replies for " + std::to_string(ops.size()) +
                                 " operations");
        }
        return replies;
    }

    /**
     * @brief Выполнить пакет записей
     * @return По одному подтверждению на операцию
     */
    std::vector<bool> executeAcks() {
        std::vector<RawValue> replies = execute();
        std::vector<bool> acks;
        acks.reserve(replies.size());
        for (const auto& reply : replies) {
            acks.push_back(reply.has_value());
        }
        return acks;
    }

private:
    std::shared_ptr<IConnection> connection_;
    std::vector<Operation> ops_;
};
