#pragma once

#include <rcache/CacheConfig.hpp>
#include <rcache/Errors.hpp>
#include <rcache/transport/IConnection.hpp>
#include <hiredis/hiredis.h>
#include <sys/time.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Соединение с Redis на базе hiredis
 *
 * Одно TCP-соединение (redisContext) на экземпляр. redisContext не
 * потокобезопасен, поэтому каждый round trip выполняется под mutex_:
 * экземпляр можно делить между потоками и кэшами через ConnectionRegistry.
 *
 * Скрипты:
 * - eval() использует EVALSHA; SHA получаем через SCRIPT LOAD и кэшируем по имени.
 *   На NOSCRIPT (сервер сбросил кэш скриптов) загружаем заново и повторяем.
 * - pipeline() тоже шлёт EVALSHA: исходник скрипта уходит на сервер один раз
 *   на соединение, а не в каждой операции пакета.
 *
 * Если соединение сломано (ctx->err), следующий вызов переподключается
 * и заново выбирает базу. Сам упавший вызов не повторяется: TransportError.
 *
 * @code
 *   ServerConfig server;
 *   server.identity = {"127.0.0.1", 6379, 2};
 *   auto conn = RedisConnection::connect(server);
 *   conn->set("k", "v", std::chrono::seconds(60));
 * @endcode
 */
class RedisConnection : public IConnection {
public:
    /**
     * @brief Подключиться к серверу
     * @throws TransportError если подключение или SELECT не удались
     */
    static std::shared_ptr<RedisConnection> connect(const ServerConfig& config) {
        return std::make_shared<RedisConnection>(config);
    }

    explicit RedisConnection(const ServerConfig& config)
        : config_(config)
        , ctx_(nullptr, &redisFree)
    {
        open();
    }

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    RawValue get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return toRawValue(command({"GET", key}).get());
    }

    std::vector<RawValue> mget(const std::vector<std::string>& keys) override {
        std::vector<std::string> args;
        args.reserve(keys.size() + 1);
        args.emplace_back("MGET");
        args.insert(args.end(), keys.begin(), keys.end());

        std::lock_guard<std::mutex> lock(mutex_);
        ReplyPtr reply = command(args);
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != keys.size()) {
            throw TransportError("Unexpected MGET reply from " + identity());
        }

        std::vector<RawValue> result;
        result.reserve(reply->elements);
        for (size_t i = 0; i < reply->elements; ++i) {
            result.push_back(toRawValue(reply->element[i]));
        }
        return result;
    }

    bool set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        return toRawValue(command(setArgs(key, value, ttl)).get()).has_value();
    }

    RawValue eval(const LuaScript& script,
                  const std::vector<std::string>& keys) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto buildArgs = [&](const std::string& sha) {
            std::vector<std::string> args{"EVALSHA", sha, std::to_string(keys.size())};
            args.insert(args.end(), keys.begin(), keys.end());
            return args;
        };

        ReplyPtr reply = command(buildArgs(scriptSha(script)), false);
        if (isNoScript(reply.get())) {
            shas_.erase(script.name);
            reply = command(buildArgs(scriptSha(script)));
        }
        return toRawValue(reply.get());
    }

    /**
     * @brief Отправить все команды, затем прочитать все ответы
     *
     * Сначала читаются все ответы пакета, и только потом они разбираются:
     * исключение при разборе (error reply, неожиданный тип) не оставляет
     * непрочитанных ответов в сокете. Если запись или чтение оборвались
     * посреди пакета, контекст сбрасывается и следующий вызов
     * переподключается.
     *
     * Скрипты уходят как EVALSHA. Операции, получившие NOSCRIPT,
     * повторяются вторым пакетом после повторного SCRIPT LOAD.
     */
    std::vector<RawValue> pipeline(const std::vector<Operation>& ops) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureConnected();

        std::vector<std::vector<std::string>> commands;
        commands.reserve(ops.size());
        for (const auto& op : ops) {
            commands.push_back(toArgs(op));
        }

        std::vector<ReplyPtr> replies = roundTrip(commands);

        std::vector<size_t> reload;
        for (size_t i = 0; i < replies.size(); ++i) {
            if (isNoScript(replies[i].get())) {
                reload.push_back(i);
            }
        }
        if (!reload.empty()) {
            shas_.clear();
            std::vector<std::vector<std::string>> retry;
            retry.reserve(reload.size());
            for (size_t i : reload) {
                retry.push_back(toArgs(ops[i]));
            }
            std::vector<ReplyPtr> retried = roundTrip(retry);
            for (size_t k = 0; k < reload.size(); ++k) {
                replies[reload[k]] = std::move(retried[k]);
            }
        }

        std::vector<RawValue> result;
        result.reserve(replies.size());
        std::string firstError;

        for (const auto& reply : replies) {
            if (reply->type == REDIS_REPLY_ERROR) {
                if (firstError.empty()) {
                    firstError = std::string(reply->str, reply->len);
                }
                result.emplace_back(std::nullopt);
                continue;
            }
            result.push_back(toRawValue(reply.get()));
        }

        if (!firstError.empty()) {
            throw TransportError("Pipeline error from " + identity() + ": " + firstError);
        }
        return result;
    }

    const ServerConfig& config() const { return config_; }

private:
    using ReplyPtr = std::unique_ptr<redisReply, void (*)(void*)>;

    /**
     * @brief argv/argvlen для redis*CommandArgv поверх std::string
     */
    class ArgvView {
    public:
        explicit ArgvView(const std::vector<std::string>& args) {
            argv_.reserve(args.size());
            argvlen_.reserve(args.size());
            for (const auto& arg : args) {
                argv_.push_back(arg.data());
                argvlen_.push_back(arg.size());
            }
        }

        int argc() const { return static_cast<int>(argv_.size()); }
        const char** argv() { return argv_.data(); }
        const size_t* argvlen() const { return argvlen_.data(); }

    private:
        std::vector<const char*> argv_;
        std::vector<size_t> argvlen_;
    };

    static timeval toTimeval(std::chrono::milliseconds ms) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(ms.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((ms.count() % 1000) * 1000);
        return tv;
    }

    std::string identity() const {
        return config_.identity.toString();
    }

    std::string contextError(const std::string& what) const {
        std::string message = what + " failed on " + identity();
        if (ctx_ && ctx_->err) {
            message += ": ";
            message += ctx_->errstr;
        }
        return message;
    }

    void open() {
        const auto& id = config_.identity;
        ctx_.reset(redisConnectWithTimeout(id.host.c_str(), id.port,
                                           toTimeval(config_.connectTimeout)));
        if (!ctx_) {
            throw TransportError("Cannot allocate redis context for " + identity());
        }
        if (ctx_->err) {
            throw TransportError(contextError("connect"));
        }
        if (redisSetTimeout(ctx_.get(), toTimeval(config_.commandTimeout)) != REDIS_OK) {
            throw TransportError(contextError("set timeout"));
        }
        if (id.db != 0) {
            command({"SELECT", std::to_string(id.db)});
        }
        shas_.clear();
    }

    void ensureConnected() {
        if (!ctx_ || ctx_->err) {
            open();
        }
    }

    /**
     * @brief Один round trip
     * @param throwOnError бросать TransportError на error reply
     */
    ReplyPtr command(const std::vector<std::string>& args, bool throwOnError = true) {
        ensureConnected();

        ArgvView argv(args);
        void* raw = redisCommandArgv(ctx_.get(), argv.argc(), argv.argv(), argv.argvlen());
        if (!raw) {
            throw TransportError(contextError(args.front()));
        }

        ReplyPtr reply(static_cast<redisReply*>(raw), &freeReplyObject);
        if (throwOnError && reply->type == REDIS_REPLY_ERROR) {
            throw TransportError(args.front() + " error from " + identity() + ": " +
                                 std::string(reply->str, reply->len));
        }
        return reply;
    }

    /**
     * @brief Записать пакет команд и прочитать ровно столько же ответов
     *
     * При сбое посреди пакета контекст сбрасывается: частично записанный
     * буфер или непрочитанные ответы не должны достаться следующему вызову.
     */
    std::vector<ReplyPtr> roundTrip(const std::vector<std::vector<std::string>>& commands) {
        ensureConnected();

        for (const auto& args : commands) {
            ArgvView argv(args);
            if (redisAppendCommandArgv(ctx_.get(), argv.argc(), argv.argv(),
                                       argv.argvlen()) != REDIS_OK) {
                fail("pipeline append");
            }
        }

        std::vector<ReplyPtr> replies;
        replies.reserve(commands.size());
        for (size_t i = 0; i < commands.size(); ++i) {
            void* raw = nullptr;
            if (redisGetReply(ctx_.get(), &raw) != REDIS_OK || !raw) {
                fail("pipeline read");
            }
            replies.emplace_back(static_cast<redisReply*>(raw), &freeReplyObject);
        }
        return replies;
    }

    [[noreturn]] void fail(const std::string& what) {
        std::string message = contextError(what);
        ctx_.reset();
        throw TransportError(message);
    }

    static bool isNoScript(const redisReply* reply) {
        return reply->type == REDIS_REPLY_ERROR &&
               std::string(reply->str, reply->len).rfind("NOSCRIPT", 0) == 0;
    }

    const std::string& scriptSha(const LuaScript& script) {
        auto it = shas_.find(script.name);
        if (it != shas_.end()) {
            return it->second;
        }

        ReplyPtr reply = command({"SCRIPT", "LOAD", script.source});
        if (reply->type != REDIS_REPLY_STRING) {
            throw TransportError("Unexpected SCRIPT LOAD reply from " + identity());
        }
        return shas_[script.name] = std::string(reply->str, reply->len);
    }

    static std::vector<std::string> setArgs(const std::string& key, const std::string& value,
                                            std::chrono::seconds ttl) {
        std::vector<std::string> args{"SET", key, value};
        if (ttl > std::chrono::seconds::zero()) {
            args.emplace_back("EX");
            args.push_back(std::to_string(ttl.count()));
        }
        return args;
    }

    /**
     * @brief Аргументы команды для пакета
     *
     * Для Eval при необходимости выполняет SCRIPT LOAD: вызывать до
     * записи первой команды пакета.
     */
    std::vector<std::string> toArgs(const Operation& op) {
        switch (op.kind) {
            case Operation::Kind::Get:
                return {"GET", op.keys.at(0)};
            case Operation::Kind::Set:
                return setArgs(op.keys.at(0), op.value, op.ttl);
            case Operation::Kind::Eval: {
                if (!op.script) {
                    throw std::invalid_argument("Eval operation without script");
                }
                std::vector<std::string> args{"EVALSHA", scriptSha(*op.script),
                                              std::to_string(op.keys.size())};
                args.insert(args.end(), op.keys.begin(), op.keys.end());
                return args;
            }
        }
        throw std::invalid_argument("Unknown operation kind");
    }

    RawValue toRawValue(const redisReply* reply) const {
        switch (reply->type) {
            case REDIS_REPLY_NIL:
                return std::nullopt;
            case REDIS_REPLY_STRING:
            case REDIS_REPLY_STATUS:
                return std::string(reply->str, reply->len);
            case REDIS_REPLY_INTEGER:
                return std::to_string(reply->integer);
            case REDIS_REPLY_ERROR:
                throw TransportError("Error reply from " + identity() + ": " +
                                     std::string(reply->str, reply->len));
            default:
                throw TransportError("Unexpected reply type " +
                                     std::to_string(reply->type) + " from " + identity());
        }
    }

private:
    ServerConfig config_;
    std::unique_ptr<redisContext, void (*)(redisContext*)> ctx_;
    std::unordered_map<std::string, std::string> shas_;
    std::mutex mutex_;
};
