#include "support/CacheStoreFixture.hpp"
#include <rcache/listeners/StatsListener.hpp>
#include <string>
#include <vector>

/**
 * @brief Тесты для CacheStore::fetch / fetchMany
 *
 * Проверяем:
 * - Классификацию: Absent / Negative / Found
 * - Поиск по вторичному индексу
 * - Пакетное чтение одним round trip с сохранением порядка
 * - Ошибки: неизвестный индекс, кортеж без индекса, повреждённые данные
 */

using namespace std::chrono_literals;

class CacheStoreFetchTest : public CacheStoreFixture {};

using Result = FetchResult<FieldMap>;

// ==================== Одиночный fetch ====================

TEST_F(CacheStoreFetchTest, StoredRecordRoundTrips) {
    auto store = makeStore();
    auto record = user("u1", "a@b.com");

    ASSERT_TRUE(store->store("u1", record));
    auto result = store->fetch("u1");

    ASSERT_TRUE(result.isFound());
    EXPECT_EQ(result.value(), record);
}

TEST_F(CacheStoreFetchTest, NeverStoredIsAbsent) {
    auto store = makeStore();

    auto result = store->fetch("nobody");

    EXPECT_TRUE(result.isAbsent());
    EXPECT_FALSE(static_cast<bool>(result));
}

TEST_F(CacheStoreFetchTest, MarkedMissingIsNegative) {
    auto store = makeStore();

    store->addMissing("ghost");

    EXPECT_TRUE(store->fetch("ghost").isNegative());
}

TEST_F(CacheStoreFetchTest, EmptyStoredValueIsAbsent) {
    auto store = makeStore();
    backend_->set("blank", "", 0s);

    EXPECT_TRUE(store->fetch("blank").isAbsent());
}

TEST_F(CacheStoreFetchTest, SingleFetchIsOneGet) {
    auto store = makeStore();

    store->fetch("u1");

    EXPECT_EQ(conn_->gets(), 1u);
    EXPECT_EQ(conn_->roundTrips(), 1u);
}

TEST_F(CacheStoreFetchTest, StoreOverwritesNegativeMarker) {
    auto store = makeStore();

    store->addMissing("u1");
    store->store("u1", user("u1", "a@b.com"));

    EXPECT_TRUE(store->fetch("u1").isFound());
}

// ==================== Вторичные индексы ====================

TEST_F(CacheStoreFetchTest, IndexLookupMatchesPrimaryLookup) {
    auto store = makeStore(withEmailIndex());
    store->store("u1", FieldMap{{"id", "u1"}, {"email", "a@b.com"}});

    auto byId = store->fetch("u1");
    auto byEmail = store->fetch(IndexTuple{"a@b.com"}, "by_email");

    ASSERT_TRUE(byEmail.isFound());
    EXPECT_EQ(byEmail, byId);
}

TEST_F(CacheStoreFetchTest, StringIdWithIndexIsOneValueTuple) {
    auto store = makeStore(withEmailIndex());
    store->store("u1", user("u1", "a@b.com"));

    auto result = store->fetch("a@b.com", std::string("by_email"));

    ASSERT_TRUE(result.isFound());
    EXPECT_EQ(result->at("id"), "u1");
}

TEST_F(CacheStoreFetchTest, IndexLookupIsOneScriptCall) {
    auto store = makeStore(withEmailIndex());
    store->store("u1", user("u1", "a@b.com"));
    conn_->reset();

    store->fetch(IndexTuple{"a@b.com"}, "by_email");

    EXPECT_EQ(conn_->evals(), 1u);
    EXPECT_EQ(conn_->roundTrips(), 1u);
}

TEST_F(CacheStoreFetchTest, IndexLookupUnknownValueIsAbsent) {
    auto store = makeStore(withEmailIndex());

    EXPECT_TRUE(store->fetch(IndexTuple{"nobody@b.com"}, "by_email").isAbsent());
}

TEST_F(CacheStoreFetchTest, IndexLookupSeesNegativeMarkerOfPrimary) {
    auto store = makeStore(withEmailIndex());
    store->store("u1", user("u1", "a@b.com"));
    store->addMissing("u1");

    EXPECT_TRUE(store->fetch(IndexTuple{"a@b.com"}, "by_email").isNegative());
}

TEST_F(CacheStoreFetchTest, MultiFieldIndex) {
    CacheConfig config;
    config.indexes.emplace_back("by_name", std::vector<std::string>{"last", "first"});
    auto store = makeStore(config);

    FieldMap record{{"id", "u7"}, {"first", "Jane"}, {"last", "Doe"}};
    store->store("u7", record);

    auto result = store->fetch(IndexTuple{"Doe", "Jane"}, "by_name");
    ASSERT_TRUE(result.isFound());
    EXPECT_EQ(result.value(), record);

    EXPECT_TRUE(store->fetch(IndexTuple{"Jane", "Doe"}, "by_name").isAbsent());
}

TEST_F(CacheStoreFetchTest, SeparatorInIndexValueRoundTrips) {
    CacheConfig config;
    config.indexes.emplace_back("by_pair", std::vector<std::string>{"a", "b"});
    auto store = makeStore(config);

    store->store("r1", FieldMap{{"a", "x:y"}, {"b", "z"}});
    store->store("r2", FieldMap{{"a", "x"}, {"b", "y:z"}});

    auto first = store->fetch(IndexTuple{"x:y", "z"}, "by_pair");
    auto second = store->fetch(IndexTuple{"x", "y:z"}, "by_pair");

    ASSERT_TRUE(first.isFound());
    ASSERT_TRUE(second.isFound());
    EXPECT_EQ(first->at("b"), "z");
    EXPECT_EQ(second->at("b"), "y:z");
}

// ==================== Ошибки ====================

TEST_F(CacheStoreFetchTest, UnknownIndexThrowsWithoutNetwork) {
    auto store = makeStore(withEmailIndex());

    EXPECT_THROW(store->fetch(IndexTuple{"x"}, "by_phone"), UnknownIndex);
    EXPECT_THROW(store->fetch("x", std::string("by_phone")), UnknownIndex);
    EXPECT_THROW(store->fetchMany(std::vector<std::string>{"x", "y"}, "by_phone"),
                 UnknownIndex);
    EXPECT_THROW(store->fetchMany(std::vector<IndexTuple>{}, "by_phone"), UnknownIndex);

    EXPECT_EQ(conn_->roundTrips(), 0u);
}

TEST_F(CacheStoreFetchTest, TupleWithoutIndexThrows) {
    auto store = makeStore(withEmailIndex());

    EXPECT_THROW(store->fetch(IndexTuple{"a@b.com"}), InvalidArgument);
    EXPECT_THROW(store->fetchMany(std::vector<IndexTuple>{IndexTuple{"a@b.com"}}),
                 InvalidArgument);
    EXPECT_EQ(conn_->roundTrips(), 0u);
}

TEST_F(CacheStoreFetchTest, TupleArityMismatchThrows) {
    auto store = makeStore(withEmailIndex());

    EXPECT_THROW(store->fetch(IndexTuple{"a", "b"}, "by_email"), InvalidArgument);
    EXPECT_EQ(conn_->roundTrips(), 0u);
}

TEST_F(CacheStoreFetchTest, CorruptedValueThrowsDecodeError) {
    auto store = makeStore();
    backend_->set("u1", "not a record", 0s);

    try {
        store->fetch("u1");
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.key(), "u1");
    }
}

/**
 * @brief Кодек, требующий поле "required": map::at бросает std::out_of_range
 */
class StrictFieldCodec : public FieldMapCodec {
public:
    FieldMap decode(const std::string& data) const override {
        FieldMap record = FieldMapCodec::decode(data);
        (void)record.at("required");
        return record;
    }
};

TEST_F(CacheStoreFetchTest, CodecLogicErrorBecomesDecodeError) {
    CacheStore<FieldMap> store(CacheConfig{}, conn_, std::make_shared<StrictFieldCodec>());
    auto stats = std::make_shared<StatsListener>();
    store.addListener(stats);
    store.store("u1", user("u1", "a@b.com"));

    try {
        store.fetch("u1");
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.key(), "u1");
    }
    EXPECT_EQ(stats->errors(), 1u);
    EXPECT_EQ(stats->hits(), 0u);
}

TEST_F(CacheStoreFetchTest, TransportErrorPropagates) {
    auto store = makeStore(withEmailIndex());
    conn_->failAll(true);

    EXPECT_THROW(store->fetch("u1"), TransportError);
    EXPECT_THROW(store->fetch(IndexTuple{"a@b.com"}, "by_email"), TransportError);
    EXPECT_THROW(store->fetchMany(std::vector<std::string>{"u1", "u2"}), TransportError);
}

// ==================== fetchMany ====================

TEST_F(CacheStoreFetchTest, BatchPreservesOrderAndClassification) {
    auto store = makeStore();
    auto r1 = user("i1", "one@b.com");
    store->store("i1", r1);
    store->addMissing("i2");
    conn_->reset();

    auto results = store->fetchMany(std::vector<std::string>{"i1", "i2", "i3"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0], Result::found(r1));
    EXPECT_EQ(results[1], Result::negative());
    EXPECT_EQ(results[2], Result::absent());

    EXPECT_EQ(conn_->mgets(), 1u);
    EXPECT_EQ(conn_->roundTrips(), 1u);
}

TEST_F(CacheStoreFetchTest, BatchWithIndexIsOnePipeline) {
    auto store = makeStore(withEmailIndex());
    store->store("u1", user("u1", "one@b.com"));
    store->store("u2", user("u2", "two@b.com"));
    store->addMissing("u3");
    backend_->set("by_email:three@b.com", "u3", 0s);
    conn_->reset();

    auto results = store->fetchMany(
        std::vector<std::string>{"two@b.com", "nobody@b.com", "three@b.com", "one@b.com"},
        "by_email");

    EXPECT_EQ(conn_->pipelines(), 1u);
    EXPECT_EQ(conn_->roundTrips(), 1u);

    ASSERT_EQ(results.size(), 4u);
    ASSERT_TRUE(results[0].isFound());
    EXPECT_EQ(results[0]->at("id"), "u2");
    EXPECT_TRUE(results[1].isAbsent());
    EXPECT_TRUE(results[2].isNegative());
    ASSERT_TRUE(results[3].isFound());
    EXPECT_EQ(results[3]->at("id"), "u1");
}

TEST_F(CacheStoreFetchTest, BatchOfTuples) {
    CacheConfig config;
    config.indexes.emplace_back("by_name", std::vector<std::string>{"last", "first"});
    auto store = makeStore(config);
    store->store("u1", FieldMap{{"first", "Jane"}, {"last", "Doe"}});
    store->store("u2", FieldMap{{"first", "John"}, {"last", "Roe"}});
    conn_->reset();

    auto results = store->fetchMany(
        std::vector<IndexTuple>{IndexTuple{"Roe", "John"}, IndexTuple{"Doe", "Jane"}},
        "by_name");

    EXPECT_EQ(conn_->roundTrips(), 1u);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0]->at("first"), "John");
    EXPECT_EQ(results[1]->at("first"), "Jane");
}

TEST_F(CacheStoreFetchTest, EmptyBatchDoesNotTouchNetwork) {
    auto store = makeStore(withEmailIndex());

    EXPECT_TRUE(store->fetchMany(std::vector<std::string>{}).empty());
    EXPECT_TRUE(store->fetchMany(std::vector<std::string>{}, "by_email").empty());
    EXPECT_TRUE(store->fetchMany(std::vector<IndexTuple>{}, "by_email").empty());
    EXPECT_EQ(conn_->roundTrips(), 0u);
}

TEST_F(CacheStoreFetchTest, BatchWithCorruptedEntryThrows) {
    auto store = makeStore();
    store->store("u1", user("u1", "a@b.com"));
    backend_->set("u2", "garbage", 0s);

    EXPECT_THROW(store->fetchMany(std::vector<std::string>{"u1", "u2"}), DecodeError);
}
