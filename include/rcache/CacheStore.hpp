#pragma once

#include <algorithm>
#include <rcache/ICacheStore.hpp>
#include <rcache/BatchExecutor.hpp>
#include <rcache/CacheConfig.hpp>
#include <rcache/ConnectionRegistry.hpp>
#include <rcache/Errors.hpp>
#include <rcache/IndexCatalog.hpp>
#include <rcache/SecondaryResolver.hpp>
#include <rcache/listeners/ICacheStoreListener.hpp>
#include <rcache/serialization/IRecordCodec.hpp>
#include <rcache/transport/IConnection.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <vector>

/**
 * @brief Read-through кэш записей поверх Redis-совместимого хранилища
 * @tparam V Тип записи
 *
 * Архитектура:
 * - Соединение получаем из ConnectionRegistry: кэши одного сервера делят его
 * - Формат записи инжектируется через IRecordCodec (Strategy pattern)
 * - Вторичные индексы описаны в IndexCatalog, разрешаются SecondaryResolver
 * - Пакетные операции идут через BatchExecutor одним round trip
 * - Слушатели получают уведомления о событиях (Observer pattern)
 *
 * Что хранится:
 * - <id>                -> закодированная запись или негативный маркер "0"
 * - <index>:<v1>:<v2>   -> <id>
 *
 * Вытеснения нет: записи живут до TTL, который применяет хранилище.
 * Конфигурация неизменна после конструктора, поэтому экземпляр можно
 * вызывать из нескольких потоков без блокировок.
 *
 * Пример использования:
 * @code
 *   CacheConfig config;
 *   config.ttl = std::chrono::seconds(300);
 *   config.indexes.emplace_back("by_email", "email");
 *
 *   CacheStore<FieldMap> users(config, registry, std::make_shared<FieldMapCodec>());
 *   users.store("u1", {{"id", "u1"}, {"email", "a@b.com"}});
 *
 *   auto byId = users.fetch("u1");
 *   auto byEmail = users.fetch(IndexTuple{"a@b.com"}, "by_email");
 * @endcode
 *
 * @note store() с индексами не атомарен. Pipeline гарантирует только порядок:
 *       при обрыве соединения возможно окно, когда основная запись уже
 *       записана, а часть индексов нет (или наоборот).
 */
template<typename V>
class CacheStore : public ICacheStore<V> {
public:
    using Index = typename ICacheStore<V>::Index;

    /// Значение на проводе, означающее "искали, в источнике нет"
    static constexpr const char* NEGATIVE_MARKER = "0";

    /**
     * @brief Конструктор с явным соединением
     * @throws ConfigurationError если конфигурация некорректна
     */
    CacheStore(const CacheConfig& config,
               std::shared_ptr<IConnection> connection,
               std::shared_ptr<IRecordCodec<V>> codec)
        : ttl_(validated(config).ttl)
        , catalog_(config.indexes)
        , connection_(std::move(connection))
        , codec_(std::move(codec))
    {
        if (!connection_) {
            throw std::invalid_argument("Connection cannot be null");
        }
        if (!codec_) {
            throw std::invalid_argument("Record codec cannot be null");
        }
        resolver_ = std::make_unique<SecondaryResolver>(connection_);
    }

    /**
     * @brief Конструктор с соединением из реестра (по config.server)
     *
     * Конфигурация проверяется до обращения к реестру: при ошибке
     * соединение не создаётся.
     */
    CacheStore(const CacheConfig& config,
               ConnectionRegistry& registry,
               std::shared_ptr<IRecordCodec<V>> codec)
        : CacheStore(config, registry.getOrCreate(validated(config).server),
                     std::move(codec))
    {}

    // ==================== fetch ====================

    /**
     * @brief Получить одну запись
     *
     * Без индекса: GET по id. С индексом: серверный скрипт по ключу <index>:<id>.
     */
    FetchResult<V> fetch(const std::string& id,
                         const Index& index = std::nullopt) override {
        if (!index) {
            return classify(id, guarded(id, [&] { return connection_->get(id); }));
        }

        const std::string key = catalog_.resolveKey(*index, std::vector<std::string>{id});
        return classify(key, guarded(key, [&] { return resolver_->resolve(key); }));
    }

    FetchResult<V> fetch(const IndexTuple& tuple,
                         const Index& index = std::nullopt) override {
        if (!index) {
            throw InvalidArgument("Tuples can only be used when fetching a secondary index");
        }

        const std::string key = catalog_.resolveKey(*index, tuple.values);
        return classify(key, guarded(key, [&] { return resolver_->resolve(key); }));
    }

    /**
     * @brief Получить несколько записей
     *
     * Без индекса: один MGET. С индексом: один pipeline из скриптов,
     * по одному на ключ. Порядок результатов совпадает с порядком ids.
     */
    std::vector<FetchResult<V>> fetchMany(const std::vector<std::string>& ids,
                                          const Index& index = std::nullopt) override {
        if (!index) {
            if (ids.empty()) {
                return {};
            }
            return classifyAll(ids, guarded(ids.front(), [&] {
                return connection_->mget(ids);
            }));
        }

        requireIndex(*index);
        std::vector<std::string> keys;
        keys.reserve(ids.size());
        for (const auto& id : ids) {
            keys.push_back(catalog_.resolveKey(*index, std::vector<std::string>{id}));
        }
        return resolveAll(keys);
    }

    std::vector<FetchResult<V>> fetchMany(const std::vector<IndexTuple>& tuples,
                                          const Index& index = std::nullopt) override {
        if (!index) {
            throw InvalidArgument("Tuples can only be used when fetching a secondary index");
        }

        requireIndex(*index);
        std::vector<std::string> keys;
        keys.reserve(tuples.size());
        for (const auto& tuple : tuples) {
            keys.push_back(catalog_.resolveKey(*index, tuple.values));
        }
        return resolveAll(keys);
    }

    // ==================== store ====================

    /**
     * @brief Сохранить запись
     *
     * Без индексов один SET. С индексами один pipeline: SET основной записи
     * и SET <index-key> -> id для каждого индекса, всё с TTL экземпляра.
     *
     * @throws InvalidArgument если в записи нет поля, нужного индексу
     *         (до обращения к сети)
     */
    bool store(const std::string& id, const V& record) override {
        const std::string encoded = codec_->encode(record);

        if (catalog_.empty()) {
            bool ok = guarded(id, [&] { return connection_->set(id, encoded, ttl_); });
            notifyStore(id, 0);
            return ok;
        }

        // Ключи индексов строим заранее: ошибка в записи не должна
        // оставить частично отправленный пакет
        std::vector<std::string> indexKeys;
        indexKeys.reserve(catalog_.size());
        auto lookup = [&](const std::string& field) { return codec_->field(record, field); };
        for (const auto& def : catalog_.definitions()) {
            indexKeys.push_back(catalog_.resolveKey(def.name, lookup));
        }

        BatchExecutor batch(connection_);
        batch.set(id, encoded, ttl_);
        for (const auto& key : indexKeys) {
            batch.set(key, id, ttl_);
        }

        std::vector<bool> acks = guarded(id, [&] { return batch.executeAcks(); });
        notifyStore(id, indexKeys.size());
        return std::all_of(acks.begin(), acks.end(), [](bool ack) { return ack; });
    }

    // ==================== addMissing ====================

    bool addMissing(const std::string& id,
                    std::optional<std::chrono::seconds> ttl = std::nullopt) override {
        const std::chrono::seconds effective = effectiveTtl(ttl);
        bool ok = guarded(id, [&] {
            return connection_->set(id, NEGATIVE_MARKER, effective);
        });
        notifyMarkMissing(id);
        return ok;
    }

    /**
     * @brief Пометить несколько id
     *
     * Один id уходит обычным SET, несколько id одним pipeline.
     */
    std::vector<bool> addMissing(const std::vector<std::string>& ids,
                                 std::optional<std::chrono::seconds> ttl = std::nullopt) override {
        if (ids.empty()) {
            return {};
        }
        if (ids.size() == 1) {
            return {addMissing(ids.front(), ttl)};
        }

        const std::chrono::seconds effective = effectiveTtl(ttl);
        BatchExecutor batch(connection_);
        for (const auto& id : ids) {
            batch.set(id, NEGATIVE_MARKER, effective);
        }

        std::vector<bool> acks = guarded(ids.front(), [&] { return batch.executeAcks(); });
        for (const auto& id : ids) {
            notifyMarkMissing(id);
        }
        return acks;
    }

    // ==================== Конфигурация ====================

    std::chrono::seconds ttl() const { return ttl_; }

    const IndexCatalog& indexes() const { return catalog_; }

    /**
     * @brief Соединение, через которое идут все операции
     */
    const std::shared_ptr<IConnection>& connection() const { return connection_; }

    // ==================== Управление слушателями ====================

    /**
     * @brief Добавить слушателя событий
     * @note Нельзя вызывать из колбэка слушателя
     */
    void addListener(std::shared_ptr<ICacheStoreListener> listener) {
        if (listener) {
            std::unique_lock lock(listenersMutex_);
            listeners_.push_back(std::move(listener));
        }
    }

    /**
     * @brief Удалить слушателя
     */
    void removeListener(const std::shared_ptr<ICacheStoreListener>& listener) {
        std::unique_lock lock(listenersMutex_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), listener),
            listeners_.end()
        );
    }

private:
    static const CacheConfig& validated(const CacheConfig& config) {
        config.validate();
        return config;
    }

    void requireIndex(const std::string& index) const {
        if (!catalog_.has(index)) {
            throw UnknownIndex(index);
        }
    }

    std::chrono::seconds effectiveTtl(std::optional<std::chrono::seconds> ttl) const {
        std::chrono::seconds effective = ttl.value_or(ttl_);
        if (effective < std::chrono::seconds::zero()) {
            throw InvalidArgument("TTL must be non-negative");
        }
        return effective;
    }

    /**
     * @brief Выполнить обращение к хранилищу, сообщив слушателям о сбое
     */
    template<typename Func>
    auto guarded(const std::string& key, Func&& operation) -> decltype(operation()) {
        try {
            return operation();
        } catch (const TransportError& e) {
            notifyError(key, e.what());
            throw;
        }
    }

    std::vector<FetchResult<V>> resolveAll(const std::vector<std::string>& keys) {
        if (keys.empty()) {
            return {};
        }

        BatchExecutor batch(connection_);
        for (const auto& key : keys) {
            resolver_->enqueue(batch, key);
        }
        return classifyAll(keys, guarded(keys.front(), [&] { return batch.execute(); }));
    }

    std::vector<FetchResult<V>> classifyAll(const std::vector<std::string>& keys,
                                            const std::vector<RawValue>& raw) {
        if (raw.size() != keys.size()) {
            throw TransportError("Expected " + std::to_string(keys.size()) +
                                 " values, got " + std::to_string(raw.size()));
        }

        std::vector<FetchResult<V>> result;
        result.reserve(keys.size());
        for (size_t i = 0; i < keys.size(); ++i) {
            result.push_back(classify(keys[i], raw[i]));
        }
        return result;
    }

    /**
     * @brief Классификация сырого значения
     *
     * nil или пустая строка -> Absent, "0" -> Negative, иначе -> декодируем.
     */
    FetchResult<V> classify(const std::string& key, const RawValue& raw) {
        if (!raw || raw->empty()) {
            notifyMiss(key);
            return FetchResult<V>::absent();
        }

        if (*raw == NEGATIVE_MARKER) {
            notifyNegative(key);
            return FetchResult<V>::negative();
        }

        std::optional<V> value;
        try {
            value.emplace(codec_->decode(*raw));
        } catch (const DecodeError& e) {
            notifyError(key, e.what());
            throw;
        } catch (const std::exception& e) {
            // Кодек может бросить что угодно (out_of_range, invalid_argument...)
            notifyError(key, e.what());
            throw DecodeError(key, e.what());
        }
        notifyHit(key);
        return FetchResult<V>::found(std::move(*value));
    }

    // ==================== Уведомления слушателей ====================

    template<typename Func>
    void notify(Func&& callback) {
        std::shared_lock lock(listenersMutex_);
        for (auto& listener : listeners_) {
            callback(*listener);
        }
    }

    void notifyHit(const std::string& key) {
        notify([&](ICacheStoreListener& l) { l.onHit(key); });
    }

    void notifyMiss(const std::string& key) {
        notify([&](ICacheStoreListener& l) { l.onMiss(key); });
    }

    void notifyNegative(const std::string& key) {
        notify([&](ICacheStoreListener& l) { l.onNegative(key); });
    }

    void notifyStore(const std::string& key, size_t indexCount) {
        notify([&](ICacheStoreListener& l) { l.onStore(key, indexCount); });
    }

    void notifyMarkMissing(const std::string& key) {
        notify([&](ICacheStoreListener& l) { l.onMarkMissing(key); });
    }

    void notifyError(const std::string& key, const std::string& message) {
        notify([&](ICacheStoreListener& l) { l.onError(key, message); });
    }

private:
    std::chrono::seconds ttl_;
    IndexCatalog catalog_;
    std::shared_ptr<IConnection> connection_;
    std::shared_ptr<IRecordCodec<V>> codec_;
    std::unique_ptr<SecondaryResolver> resolver_;

    std::vector<std::shared_ptr<ICacheStoreListener>> listeners_;
    mutable std::shared_mutex listenersMutex_;
};
