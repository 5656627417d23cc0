#include <rcache/CacheStore.hpp>
#include <rcache/listeners/LoggingListener.hpp>
#include <rcache/listeners/StatsListener.hpp>
#include <rcache/serialization/FieldMapCodec.hpp>
#include <rcache/transport/InMemoryConnection.hpp>

#include <iostream>
#include <sstream>
#include <chrono>
#include <random>
#include <vector>
#include <string>
#include <iomanip>
#include <thread>

/**
 * @brief Бенчмарк для CacheStore
 *
 * Измеряем:
 * - Throughput store/fetch поверх хранилища без задержки (ops/sec)
 * - Стоимость кодека записи
 * - Выигрыш пакетного fetchMany над серией одиночных fetch
 *   при имитации сетевой задержки round trip
 * - Влияние слушателей на производительность
 */

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

/**
 * @brief Соединение с фиксированной задержкой на каждый round trip
 *
 * Имитирует сеть между приложением и сервером: pipeline платит
 * задержку один раз, серия одиночных команд платит на каждой.
 */
class LatencyConnection : public IConnection {
public:
    LatencyConnection(std::shared_ptr<IConnection> inner, std::chrono::microseconds rtt)
        : inner_(std::move(inner))
        , rtt_(rtt)
    {}

    RawValue get(const std::string& key) override {
        wait();
        return inner_->get(key);
    }

    std::vector<RawValue> mget(const std::vector<std::string>& keys) override {
        wait();
        return inner_->mget(keys);
    }

    bool set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl) override {
        wait();
        return inner_->set(key, value, ttl);
    }

    RawValue eval(const LuaScript& script, const std::vector<std::string>& keys) override {
        wait();
        return inner_->eval(script, keys);
    }

    std::vector<RawValue> pipeline(const std::vector<Operation>& ops) override {
        wait();
        return inner_->pipeline(ops);
    }

private:
    void wait() const {
        std::this_thread::sleep_for(rtt_);
    }

    std::shared_ptr<IConnection> inner_;
    std::chrono::microseconds rtt_;
};

FieldMap makeRecord(size_t i) {
    std::string id = "u" + std::to_string(i);
    return FieldMap{
        {"id", id},
        {"email", id + "@example.com"},
        {"name", "User " + std::to_string(i)},
        {"country", i % 2 == 0 ? "RU" : "DE"},
    };
}

CacheConfig indexedConfig() {
    CacheConfig config;
    config.ttl = std::chrono::seconds(300);
    config.indexes.emplace_back("by_email", "email");
    return config;
}

// ==================== Базовые бенчмарки ====================

void benchmarkCodec(size_t numOperations) {
    FieldMapCodec codec;
    FieldMap record = makeRecord(42);
    std::string encoded;

    double encodeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            encoded = codec.encode(record);
        }
    });
    printResult("FieldMapCodec::encode", encodeMs, numOperations);

    size_t fields = 0;
    double decodeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            fields += codec.decode(encoded).size();
        }
    });
    printResult("FieldMapCodec::decode", decodeMs, numOperations);
    (void)fields;
}

void benchmarkStore(size_t numOperations, bool withIndex) {
    auto conn = std::make_shared<InMemoryConnection>();
    CacheStore<FieldMap> store(withIndex ? indexedConfig() : CacheConfig{}, conn,
                               std::make_shared<FieldMapCodec>());

    std::vector<FieldMap> records;
    records.reserve(numOperations);
    for (size_t i = 0; i < numOperations; ++i) {
        records.push_back(makeRecord(i));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            store.store(records[i].at("id"), records[i]);
        }
    });

    printResult(withIndex ? "store (1 index, pipeline)" : "store (no index, SET)",
                timeMs, numOperations);
}

void benchmarkRandomFetch(size_t numRecords, size_t numOperations, size_t keyRange) {
    auto conn = std::make_shared<InMemoryConnection>();
    CacheStore<FieldMap> store(CacheConfig{}, conn, std::make_shared<FieldMapCodec>());
    auto stats = std::make_shared<StatsListener>();

    for (size_t i = 0; i < numRecords; ++i) {
        store.store("u" + std::to_string(i), makeRecord(i));
    }
    store.addListener(stats);

    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(0, keyRange - 1);

    std::vector<std::string> keys(numOperations);
    for (size_t i = 0; i < numOperations; ++i) {
        keys[i] = "u" + std::to_string(dist(rng));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            if (store.fetch(keys[i]).isAbsent()) {
                store.addMissing(keys[i]);
            }
        }
    });

    printResult("Random fetch (range=" + std::to_string(keyRange) + ")", timeMs, numOperations);

    std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
              << (stats->hitRate() * 100) << "%\n";
}

// ==================== Ключевой бенчмарк: round trips ====================

/**
 * @brief N одиночных fetch против одного fetchMany
 *
 * При задержке round trip в rtt серия стоит ~N * rtt, пакет ~rtt.
 */
void benchmarkBatchVsSingle(size_t batchSize, std::chrono::microseconds rtt, bool byIndex) {
    auto backend = std::make_shared<InMemoryConnection>();
    auto conn = std::make_shared<LatencyConnection>(backend, rtt);

    {
        CacheStore<FieldMap> loader(indexedConfig(), backend, std::make_shared<FieldMapCodec>());
        for (size_t i = 0; i < batchSize; ++i) {
            loader.store("u" + std::to_string(i), makeRecord(i));
        }
    }

    CacheStore<FieldMap> store(indexedConfig(), conn, std::make_shared<FieldMapCodec>());
    CacheStore<FieldMap>::Index index;
    std::vector<std::string> keys;
    for (size_t i = 0; i < batchSize; ++i) {
        keys.push_back(byIndex ? "u" + std::to_string(i) + "@example.com"
                               : "u" + std::to_string(i));
    }
    if (byIndex) {
        index = "by_email";
    }

    std::cout << "\n--- " << batchSize << " keys, rtt=" << rtt.count() << "us"
              << (byIndex ? ", by_email" : ", by id") << " ---\n";

    size_t found = 0;
    double singleMs = measureMs([&]() {
        for (const auto& key : keys) {
            if (store.fetch(key, index).isFound()) {
                ++found;
            }
        }
    });
    printResult("Single fetch x " + std::to_string(batchSize), singleMs, batchSize);

    double batchMs = measureMs([&]() {
        for (const auto& result : store.fetchMany(keys, index)) {
            if (result.isFound()) {
                ++found;
            }
        }
    });
    printResult("fetchMany (1 round trip)", batchMs, batchSize);

    std::cout << "   Speedup: " << std::fixed << std::setprecision(1)
              << (singleMs / batchMs) << "x, found " << found << "/" << batchSize * 2 << "\n";
}

// ==================== Слушатели ====================

void benchmarkListenerOverhead(size_t numOperations) {
    std::cout << "\n--- Listener overhead ---\n";

    auto run = [&](const std::string& name, bool withStats, bool withLogging) {
        auto conn = std::make_shared<InMemoryConnection>();
        CacheStore<FieldMap> store(CacheConfig{}, conn, std::make_shared<FieldMapCodec>());
        std::ostringstream sink;

        if (withStats) {
            store.addListener(std::make_shared<StatsListener>());
        }
        if (withLogging) {
            store.addListener(std::make_shared<LoggingListener>("bench", sink));
        }

        store.store("u1", makeRecord(1));

        double timeMs = measureMs([&]() {
            for (size_t i = 0; i < numOperations; ++i) {
                store.fetch(i % 2 == 0 ? "u1" : "u2");
            }
        });
        printResult(name, timeMs, numOperations);
    };

    run("No listeners", false, false);
    run("StatsListener", true, false);
    run("StatsListener + LoggingListener", true, true);
}

// ==================== Многопоточность ====================

void benchmarkConcurrentFetch(size_t numThreads, size_t opsPerThread) {
    auto conn = std::make_shared<InMemoryConnection>();
    CacheStore<FieldMap> store(indexedConfig(), conn, std::make_shared<FieldMapCodec>());

    for (size_t i = 0; i < 1000; ++i) {
        store.store("u" + std::to_string(i), makeRecord(i));
    }

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < numThreads; ++t) {
            threads.emplace_back([&store, t, opsPerThread]() {
                for (size_t i = 0; i < opsPerThread; ++i) {
                    store.fetch("u" + std::to_string((t * 31 + i) % 1000));
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult("Concurrent fetch (" + std::to_string(numThreads) + " threads)",
                timeMs, numThreads * opsPerThread);
}

int main() {
    const size_t NUM_OPS = 200000;

    std::cout << "=== CacheStore Benchmark ===\n";
    std::cout << "Operations: " << NUM_OPS << "\n\n";

    try {
        std::cout << "--- Codec ---\n";
        benchmarkCodec(NUM_OPS);

        std::cout << "\n--- Basic operations (no latency) ---\n";
        benchmarkStore(NUM_OPS / 4, false);
        benchmarkStore(NUM_OPS / 4, true);
        benchmarkRandomFetch(10000, NUM_OPS, 10000);
        benchmarkRandomFetch(10000, NUM_OPS, 20000);

        // Ключевой бенчмарк: пакет против серии
        benchmarkBatchVsSingle(100, std::chrono::microseconds(200), false);
        benchmarkBatchVsSingle(100, std::chrono::microseconds(200), true);
        benchmarkBatchVsSingle(500, std::chrono::microseconds(100), true);

        benchmarkListenerOverhead(NUM_OPS);

        std::cout << "\n--- Concurrency ---\n";
        benchmarkConcurrentFetch(1, NUM_OPS);
        benchmarkConcurrentFetch(4, NUM_OPS / 4);
        benchmarkConcurrentFetch(8, NUM_OPS / 8);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
