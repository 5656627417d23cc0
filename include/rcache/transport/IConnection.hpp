#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Сырое значение из хранилища: строка или отсутствие ключа (nil)
 */
using RawValue = std::optional<std::string>;

/**
 * @brief Серверный скрипт (Lua), выполняемый атомарно
 *
 * name используется для кэширования SHA в соединении и для
 * нативной эмуляции в InMemoryConnection.
 */
struct LuaScript {
    std::string name;
    std::string source;
};

/**
 * @brief Одна операция в pipeline
 */
struct Operation {
    enum class Kind { Get, Set, Eval };

    Kind kind = Kind::Get;
    std::vector<std::string> keys;
    std::string value;                  // Set
    std::chrono::seconds ttl{0};        // Set, 0: без истечения
    const LuaScript* script = nullptr;  // Eval, должен жить до выполнения pipeline

    static Operation get(std::string key) {
        Operation op;
        op.kind = Kind::Get;
        op.keys.push_back(std::move(key));
        return op;
    }

    static Operation set(std::string key, std::string value, std::chrono::seconds ttl) {
        Operation op;
        op.kind = Kind::Set;
        op.keys.push_back(std::move(key));
        op.value = std::move(value);
        op.ttl = ttl;
        return op;
    }

    static Operation eval(const LuaScript& script, std::vector<std::string> keys) {
        Operation op;
        op.kind = Kind::Eval;
        op.keys = std::move(keys);
        op.script = &script;
        return op;
    }
};

/**
 * @brief Соединение с хранилищем ключ-значение (Redis-совместимый протокол)
 *
 * Контракт:
 * - Каждый метод: один сетевой round trip.
 * - pipeline() отправляет все операции вместе и возвращает ответы
 *   в порядке операций. Это не транзакция: при обрыве соединения
 *   часть операций может быть применена.
 * - Ответ на Set в pipeline: "OK" при успехе, nullopt если запись не выполнена.
 * - Реализации должны быть безопасны для одновременного использования
 *   из нескольких потоков.
 * - Любой сбой: TransportError.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief GET key
     */
    virtual RawValue get(const std::string& key) = 0;

    /**
     * @brief MGET keys...
     * @return Значения в порядке ключей
     */
    virtual std::vector<RawValue> mget(const std::vector<std::string>& keys) = 0;

    /**
     * @brief SET key value [EX ttl]
     * @param ttl 0: без истечения
     * @return true если сервер подтвердил запись
     */
    virtual bool set(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl) = 0;

    /**
     * @brief Атомарно выполнить серверный скрипт
     * @param script Скрипт
     * @param keys KEYS[1..n]
     * @return Строковый результат скрипта или nullopt
     */
    virtual RawValue eval(const LuaScript& script,
                          const std::vector<std::string>& keys) = 0;

    /**
     * @brief Выполнить операции одним round trip
     * @return Ответы в порядке операций
     */
    virtual std::vector<RawValue> pipeline(const std::vector<Operation>& ops) = 0;
};
