#include "support/CacheStoreFixture.hpp"
#include <rcache/ConnectionRegistry.hpp>
#include <rcache/transport/RedisConnection.hpp>
#include <rcache/transport/Scripts.hpp>
#include <atomic>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Интеграционные тесты с живым Redis
 *
 * Адрес сервера: RCACHE_REDIS_HOST / RCACHE_REDIS_PORT
 * (по умолчанию localhost:6379, база 15).
 * Без доступного сервера тесты пропускаются.
 */

using namespace std::chrono_literals;

namespace {

ServerConfig testServer() {
    ServerConfig server;
    if (const char* host = std::getenv("RCACHE_REDIS_HOST")) {
        server.identity.host = host;
    }
    if (const char* port = std::getenv("RCACHE_REDIS_PORT")) {
        server.identity.port = static_cast<uint16_t>(std::stoi(port));
    }
    server.identity.db = 15;
    server.connectTimeout = 500ms;
    return server;
}

}  // namespace

class RedisConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        try {
            conn_ = RedisConnection::connect(testServer());
        } catch (const TransportError& e) {
            GTEST_SKIP() << "Redis is not available: " << e.what();
        }
        prefix_ = "rcache-test:" + std::string(
            ::testing::UnitTest::GetInstance()->current_test_info()->name()) + ":";
    }

    std::string key(const std::string& name) const { return prefix_ + name; }

    std::shared_ptr<RedisConnection> conn_;
    std::string prefix_;
};

TEST_F(RedisConnectionTest, SetAndGet) {
    EXPECT_TRUE(conn_->set(key("a"), "value", 60s));

    auto value = conn_->get(key("a"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "value");

    EXPECT_FALSE(conn_->get(key("missing")).has_value());
}

TEST_F(RedisConnectionTest, MgetKeepsOrderAndNils) {
    conn_->set(key("a"), "1", 60s);
    conn_->set(key("c"), "3", 60s);

    auto values = conn_->mget({key("a"), key("b"), key("c")});

    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(values[0], std::optional<std::string>("1"));
    EXPECT_FALSE(values[1].has_value());
    EXPECT_EQ(values[2], std::optional<std::string>("3"));
}

TEST_F(RedisConnectionTest, BinaryValuesSurvive) {
    std::string binary("a\0b\r\nc", 6);
    conn_->set(key("bin"), binary, 60s);

    auto value = conn_->get(key("bin"));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, binary);
}

TEST_F(RedisConnectionTest, SecondaryScriptResolvesPrimary) {
    conn_->set(key("u1"), "record", 60s);
    conn_->set(key("idx"), key("u1"), 60s);
    conn_->set(key("dangling"), key("gone"), 60s);

    EXPECT_EQ(conn_->eval(getSecondaryScript(), {key("idx")}),
              std::optional<std::string>("record"));
    EXPECT_FALSE(conn_->eval(getSecondaryScript(), {key("dangling")}).has_value());
    EXPECT_FALSE(conn_->eval(getSecondaryScript(), {key("none")}).has_value());
}

TEST_F(RedisConnectionTest, PipelineRepliesInOrder) {
    conn_->set(key("idx"), key("u1"), 60s);

    std::vector<Operation> ops{
        Operation::set(key("u1"), "record", 60s),
        Operation::get(key("u1")),
        Operation::eval(getSecondaryScript(), {key("idx")}),
        Operation::get(key("missing")),
    };

    auto replies = conn_->pipeline(ops);

    ASSERT_EQ(replies.size(), 4u);
    EXPECT_TRUE(replies[0].has_value());
    EXPECT_EQ(replies[1], std::optional<std::string>("record"));
    EXPECT_EQ(replies[2], std::optional<std::string>("record"));
    EXPECT_FALSE(replies[3].has_value());
}

TEST_F(RedisConnectionTest, CacheStoreEndToEnd) {
    CacheConfig config;
    config.ttl = 60s;
    config.server = testServer();
    config.indexes.emplace_back(prefix_ + "by_email", "email");

    auto conn = conn_;
    ConnectionRegistry registry([conn](const ServerConfig&) -> std::shared_ptr<IConnection> {
        return conn;
    });
    CacheStore<FieldMap> store(config, registry, std::make_shared<FieldMapCodec>());

    FieldMap record{{"id", key("u1")}, {"email", "a@b.com"}};
    ASSERT_TRUE(store.store(key("u1"), record));
    store.addMissing(key("u2"));

    auto byEmail = store.fetch(IndexTuple{"a@b.com"}, prefix_ + "by_email");
    ASSERT_TRUE(byEmail.isFound());
    EXPECT_EQ(byEmail.value(), record);

    auto results = store.fetchMany(std::vector<std::string>{key("u1"), key("u2"), key("u3")});
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].isFound());
    EXPECT_TRUE(results[1].isNegative());
    EXPECT_TRUE(results[2].isAbsent());
}

TEST_F(RedisConnectionTest, ConcurrentCallsShareConnection) {
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t, &failures]() {
            for (int i = 0; i < 50; ++i) {
                std::string k = key("c" + std::to_string(t) + ":" + std::to_string(i));
                conn_->set(k, std::to_string(i), 60s);
                auto value = conn_->get(k);
                if (!value || *value != std::to_string(i)) {
                    ++failures;
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(failures.load(), 0);
}

TEST(RedisConnectionConnectTest, UnreachableServerThrowsTransportError) {
    ServerConfig server;
    server.identity.host = "127.0.0.1";
    server.identity.port = 1;
    server.connectTimeout = 200ms;

    EXPECT_THROW(RedisConnection::connect(server), TransportError);
}
