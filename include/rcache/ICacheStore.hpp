#pragma once

#include <rcache/FetchResult.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Базовый интерфейс кэша записей
 * @tparam V Тип записи
 *
 * Контракт, от которого зависит слой доступа к записям: он сам решает,
 * когда идти в кэш, а когда в базу данных, и когда сохранять результат.
 */
template<typename V>
class ICacheStore {
public:
    using Index = std::optional<std::string>;

    virtual ~ICacheStore() = default;

    /**
     * @brief Получить запись по id или по значению одиночного индекса
     * @param id Первичный id, либо значение поля, если задан index
     * @param index Имя вторичного индекса
     * @return Absent, Negative или Found
     * @throws UnknownIndex если индекса нет
     */
    virtual FetchResult<V> fetch(const std::string& id,
                                 const Index& index = std::nullopt) = 0;

    /**
     * @brief Получить запись по кортежу значений индекса
     * @throws InvalidArgument если index не задан
     */
    virtual FetchResult<V> fetch(const IndexTuple& tuple,
                                 const Index& index = std::nullopt) = 0;

    /**
     * @brief Получить несколько записей одним round trip
     * @return Результаты в порядке ids
     */
    virtual std::vector<FetchResult<V>> fetchMany(const std::vector<std::string>& ids,
                                                  const Index& index = std::nullopt) = 0;

    /**
     * @brief Получить несколько записей по кортежам индекса одним round trip
     * @throws InvalidArgument если index не задан
     */
    virtual std::vector<FetchResult<V>> fetchMany(const std::vector<IndexTuple>& tuples,
                                                  const Index& index = std::nullopt) = 0;

    /**
     * @brief Сохранить запись и все её индексы
     * @return true если хранилище подтвердило все записи
     */
    virtual bool store(const std::string& id, const V& record) = 0;

    /**
     * @brief Пометить id как отсутствующий в источнике истины
     * @param ttl TTL маркера; по умолчанию TTL экземпляра
     */
    virtual bool addMissing(const std::string& id,
                            std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

    /**
     * @brief Пометить несколько id одним round trip
     * @return Подтверждения в порядке ids
     */
    virtual std::vector<bool> addMissing(const std::vector<std::string>& ids,
                                         std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;
};
