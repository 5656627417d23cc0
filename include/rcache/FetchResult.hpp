#pragma once

#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Результат чтения одного ключа из кэша
 * @tparam V Тип записи
 *
 * Три состояния:
 * - Absent  : ключа нет в хранилище (ещё не искали или истёк TTL)
 * - Negative: ключ помечен как отсутствующий в источнике истины (addMissing)
 * - Found   : запись найдена и декодирована
 *
 * На проводе Negative представлен зарезервированным значением "0",
 * но сравнение с ним выполняется в одном месте, при классификации.
 */
template<typename V>
class FetchResult {
public:
    enum class State { Absent, Negative, Found };

    FetchResult() = default;

    static FetchResult absent() { return FetchResult(); }

    static FetchResult negative() {
        FetchResult result;
        result.state_ = State::Negative;
        return result;
    }

    static FetchResult found(V record) {
        FetchResult result;
        result.state_ = State::Found;
        result.record_ = std::move(record);
        return result;
    }

    State state() const { return state_; }
    bool isAbsent() const { return state_ == State::Absent; }
    bool isNegative() const { return state_ == State::Negative; }
    bool isFound() const { return state_ == State::Found; }

    explicit operator bool() const { return isFound(); }

    /**
     * @brief Доступ к записи
     * @throws std::logic_error если запись не найдена
     */
    const V& value() const {
        if (!record_) {
            throw std::logic_error("FetchResult holds no record");
        }
        return *record_;
    }

    const V* operator->() const { return &value(); }
    const V& operator*() const { return value(); }

    bool operator==(const FetchResult& other) const {
        return state_ == other.state_ && record_ == other.record_;
    }

    bool operator!=(const FetchResult& other) const {
        return !(*this == other);
    }

private:
    State state_ = State::Absent;
    std::optional<V> record_;
};

/**
 * @brief Кортеж значений полей для поиска по вторичному индексу
 *
 * Отдельный тип, чтобы fetch(IndexTuple{...}, "by_name") не путался
 * с fetch("id"). Порядок значений совпадает с порядком полей в IndexDefinition.
 */
struct IndexTuple {
    std::vector<std::string> values;

    IndexTuple() = default;
    IndexTuple(std::initializer_list<std::string> list) : values(list) {}
    explicit IndexTuple(std::vector<std::string> list) : values(std::move(list)) {}

    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
};
