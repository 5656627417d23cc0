#include <gtest/gtest.h>
#include <rcache/transport/RedisConnection.hpp>
#include "support/FakeRedisServer.hpp"
#include <atomic>
#include <string>
#include <vector>

/**
 * @brief Тесты RedisConnection::pipeline против сервера со сценарием ответов
 *
 * Живой Redis не нужен. Проверяем:
 * - После сбоя пакета следующий вызов получает свой ответ, а не чужой
 * - Обрыв посреди пакета: переподключение
 * - Скрипты в пакете идут через EVALSHA, SCRIPT LOAD один раз
 * - NOSCRIPT в пакете: перезагрузка скрипта и повтор
 */

namespace {

using Command = FakeRedisServer::Command;

const std::string SCRIPT_SHA = "e0e1f9fabfc9d4800c877a703b823ac0578ff8db";

ServerConfig localConfig(uint16_t port) {
    ServerConfig config;
    config.identity.host = "127.0.0.1";
    config.identity.port = port;
    config.identity.db = 0;
    return config;
}

/**
 * @brief GET k -> "value of k", SET -> OK, скрипт -> Lua-таблица {1, 2}
 */
std::string tableScriptResponder(const Command& command) {
    const std::string& name = command[0];
    if (name == "GET") {
        return FakeRedisServer::bulk("value of " + command[1]);
    }
    if (name == "SET") {
        return FakeRedisServer::ok();
    }
    if (name == "SCRIPT") {
        return FakeRedisServer::bulk(SCRIPT_SHA);
    }
    if (name == "EVALSHA" || name == "EVAL") {
        return FakeRedisServer::array({1, 2});
    }
    return FakeRedisServer::error("ERR unknown command '" + name + "'");
}

}  // namespace

// ==================== Синхронность ответов ====================

TEST(RedisPipelineTest, UnexpectedReplyTypeLeavesNoStaleReplies) {
    FakeRedisServer server(tableScriptResponder);
    RedisConnection conn(localConfig(server.port()));
    LuaScript tableScript{"table", "return {1, 2}"};

    EXPECT_THROW(
        conn.pipeline({Operation::eval(tableScript, {"k"}), Operation::get("k")}),
        TransportError
    );

    auto value = conn.get("x");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value of x");
    EXPECT_EQ(server.connections(), 1u);
}

TEST(RedisPipelineTest, ErrorReplyLeavesNoStaleReplies) {
    FakeRedisServer server([](const Command& command) {
        if (command[0] == "SET") {
            return FakeRedisServer::error("READONLY You can't write against a read only replica");
        }
        return tableScriptResponder(command);
    });
    RedisConnection conn(localConfig(server.port()));

    EXPECT_THROW(
        conn.pipeline({Operation::set("a", "1", std::chrono::seconds(0)),
                       Operation::get("b"),
                       Operation::get("c")}),
        TransportError
    );

    auto value = conn.get("x");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value of x");
}

TEST(RedisPipelineTest, ConnectionDroppedMidBatchReconnects) {
    FakeRedisServer server([](const Command& command) {
        if (command[0] == "GET" && command[1] == "drop") {
            return std::string();
        }
        return tableScriptResponder(command);
    });
    RedisConnection conn(localConfig(server.port()));

    EXPECT_THROW(
        conn.pipeline({Operation::get("a"), Operation::get("drop"), Operation::get("b")}),
        TransportError
    );

    auto value = conn.get("x");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value of x");
    EXPECT_EQ(server.connections(), 2u);
}

// ==================== Скрипты в пакете ====================

TEST(RedisPipelineTest, ScriptLoadedOnceAndSentBySha) {
    FakeRedisServer server([](const Command& command) {
        if (command[0] == "EVALSHA") {
            return FakeRedisServer::bulk("found " + command[3]);
        }
        return tableScriptResponder(command);
    });
    RedisConnection conn(localConfig(server.port()));
    LuaScript script{"lookup", "return redis.call('GET', KEYS[1])"};

    auto first = conn.pipeline({Operation::eval(script, {"k1"}),
                                Operation::eval(script, {"k2"}),
                                Operation::get("k3")});
    auto second = conn.pipeline({Operation::eval(script, {"k4"})});

    ASSERT_EQ(first.size(), 3u);
    EXPECT_EQ(first[0], std::optional<std::string>("found k1"));
    EXPECT_EQ(first[1], std::optional<std::string>("found k2"));
    EXPECT_EQ(first[2], std::optional<std::string>("value of k3"));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], std::optional<std::string>("found k4"));

    EXPECT_EQ(server.count("SCRIPT"), 1u);
    EXPECT_EQ(server.count("EVALSHA"), 3u);
    EXPECT_EQ(server.count("EVAL"), 0u);

    for (const auto& command : server.commands()) {
        if (command[0] == "EVALSHA") {
            EXPECT_EQ(command[1], SCRIPT_SHA);
        }
    }
}

TEST(RedisPipelineTest, NoScriptInBatchReloadsAndRetries) {
    std::atomic<bool> loaded{false};
    FakeRedisServer server([&](const Command& command) {
        if (command[0] == "SCRIPT") {
            loaded = true;
            return FakeRedisServer::bulk(SCRIPT_SHA);
        }
        if (command[0] == "EVALSHA") {
            if (!loaded) {
                return FakeRedisServer::error("NOSCRIPT No matching script. Please use EVAL.");
            }
            return FakeRedisServer::bulk("found " + command[3]);
        }
        return tableScriptResponder(command);
    });
    RedisConnection conn(localConfig(server.port()));
    LuaScript script{"lookup", "return redis.call('GET', KEYS[1])"};

    conn.pipeline({Operation::eval(script, {"k1"})});
    loaded = false;  // SCRIPT FLUSH на сервере

    auto result = conn.pipeline({Operation::get("a"), Operation::eval(script, {"k2"})});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], std::optional<std::string>("value of a"));
    EXPECT_EQ(result[1], std::optional<std::string>("found k2"));
    EXPECT_EQ(server.count("SCRIPT"), 2u);
}
