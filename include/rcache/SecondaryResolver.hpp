#pragma once

#include <rcache/BatchExecutor.hpp>
#include <rcache/transport/IConnection.hpp>
#include <rcache/transport/Scripts.hpp>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Разрешение вторичного ключа в значение основной записи
 *
 * Двухшаговая операция "ключ индекса -> первичный id -> значение"
 * выполняется на сервере одним скриптом. Две отдельные клиентские GET
 * дали бы гонку: основная запись могла бы истечь или смениться между ними.
 *
 * В пакетном fetch каждая операция ставится в общий pipeline:
 * атомарность на ключ, а не на весь пакет.
 */
class SecondaryResolver {
public:
    explicit SecondaryResolver(std::shared_ptr<IConnection> connection)
        : connection_(std::move(connection))
    {
        if (!connection_) {
            throw std::invalid_argument("Connection cannot be null");
        }
    }

    /**
     * @brief Разрешить один ключ (один round trip)
     * @return Значение основной записи или nullopt
     */
    RawValue resolve(const std::string& indexKey) const {
        return connection_->eval(getSecondaryScript(), {indexKey});
    }

    /**
     * @brief Поставить разрешение ключа в pipeline
     */
    void enqueue(BatchExecutor& batch, const std::string& indexKey) const {
        batch.eval(getSecondaryScript(), {indexKey});
    }

private:
    std::shared_ptr<IConnection> connection_;
};
