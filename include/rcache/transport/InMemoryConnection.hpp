#pragma once

#include <rcache/Errors.hpp>
#include <rcache/transport/IConnection.hpp>
#include <rcache/transport/Scripts.hpp>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Хранилище ключ-значение внутри процесса
 *
 * Ведёт себя как однопоточный Redis-сервер для операций, которые использует
 * CacheStore: GET, MGET, SET [EX], pipeline и скрипт getSecondaryScript().
 * Скрипты выполняются нативно по имени, Lua не интерпретируется.
 *
 * TTL через lazy expiration: ключ удаляется при первом обращении после
 * момента истечения (now >= expireAt), как в Redis.
 *
 * Часы инжектируются, чтобы тесты TTL не зависели от sleep:
 * @code
 *   auto now = InMemoryConnection::Clock::now();
 *   InMemoryConnection conn([&] { return now; });
 *   conn.set("k", "v", std::chrono::seconds(5));
 *   now += std::chrono::seconds(5);
 *   conn.get("k");  // nullopt
 * @endcode
 */
class InMemoryConnection : public IConnection {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowFunction = std::function<TimePoint()>;

    explicit InMemoryConnection(NowFunction now = [] { return Clock::now(); })
        : now_(std::move(now))
    {
        if (!now_) {
            throw std::invalid_argument("Clock function cannot be null");
        }
    }

    RawValue get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return getLocked(key);
    }

    std::vector<RawValue> mget(const std::vector<std::string>& keys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RawValue> result;
        result.reserve(keys.size());
        for (const auto& key : keys) {
            result.push_back(getLocked(key));
        }
        return result;
    }

    bool set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        setLocked(key, value, ttl);
        return true;
    }

    RawValue eval(const LuaScript& script,
                  const std::vector<std::string>& keys) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return evalLocked(script, keys);
    }

    /**
     * @brief Все операции выполняются под одной блокировкой, по порядку
     */
    std::vector<RawValue> pipeline(const std::vector<Operation>& ops) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RawValue> result;
        result.reserve(ops.size());

        for (const auto& op : ops) {
            switch (op.kind) {
                case Operation::Kind::Get:
                    result.push_back(getLocked(op.keys.at(0)));
                    break;
                case Operation::Kind::Set:
                    setLocked(op.keys.at(0), op.value, op.ttl);
                    result.emplace_back("OK");
                    break;
                case Operation::Kind::Eval:
                    if (!op.script) {
                        throw TransportError("ERR Eval operation without script");
                    }
                    result.push_back(evalLocked(*op.script, op.keys));
                    break;
            }
        }

        return result;
    }

    // ==================== Инспекция (тесты, отладка) ====================

    /**
     * @brief Оставшееся время жизни ключа
     * @return nullopt если ключа нет или он бессрочный
     */
    std::optional<Clock::duration> timeToLive(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!getLocked(key)) {
            return std::nullopt;
        }
        auto it = expirationTimes_.find(key);
        if (it == expirationTimes_.end()) {
            return std::nullopt;
        }
        return it->second - now_();
    }

    /**
     * @brief Количество живых ключей
     */
    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        removeExpiredLocked();
        return data_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
        expirationTimes_.clear();
    }

private:
    RawValue getLocked(const std::string& key) {
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        if (isExpiredLocked(key)) {
            data_.erase(it);
            expirationTimes_.erase(key);
            return std::nullopt;
        }
        return it->second;
    }

    void setLocked(const std::string& key, const std::string& value,
                   std::chrono::seconds ttl) {
        data_[key] = value;
        if (ttl > std::chrono::seconds::zero()) {
            expirationTimes_[key] = now_() + ttl;
        } else {
            // SET без EX снимает прежний TTL
            expirationTimes_.erase(key);
        }
    }

    RawValue evalLocked(const LuaScript& script, const std::vector<std::string>& keys) {
        if (script.name == getSecondaryScript().name) {
            if (keys.size() != 1) {
                throw TransportError("ERR " + script.name + " expects exactly one key");
            }
            RawValue primary = getLocked(keys[0]);
            if (!primary) {
                return std::nullopt;
            }
            return getLocked(*primary);
        }
        throw TransportError("NOSCRIPT No matching script: " + script.name);
    }

    bool isExpiredLocked(const std::string& key) const {
        auto it = expirationTimes_.find(key);
        return it != expirationTimes_.end() && now_() >= it->second;
    }

    void removeExpiredLocked() {
        TimePoint now = now_();
        for (auto it = expirationTimes_.begin(); it != expirationTimes_.end();) {
            if (now >= it->second) {
                data_.erase(it->first);
                it = expirationTimes_.erase(it);
            } else {
                ++it;
            }
        }
    }

private:
    NowFunction now_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;

    /// Карта: ключ → время истечения (только для ключей с TTL)
    std::unordered_map<std::string, TimePoint> expirationTimes_;
};
