#pragma once

#include <rcache/CacheConfig.hpp>
#include <rcache/Errors.hpp>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Каталог вторичных индексов
 *
 * Ключ индекса: <имя>:<значение-1>:<значение-2>:...
 * в порядке полей из IndexDefinition.
 *
 * Значения экранируются: '\' -> "\\", ':' -> "\:". Так значение с двоеточием
 * не может "сдвинуть" границу между полями, а значения без этих символов
 * дают ровно <имя>:<v1>:<v2>.
 */
class IndexCatalog {
public:
    static constexpr char SEPARATOR = ':';
    static constexpr char ESCAPE = '\\';

    /// Чтение поля записи по имени; nullopt: поля нет
    using FieldLookup = std::function<std::optional<std::string>(const std::string&)>;

    IndexCatalog() = default;

    /**
     * @throws ConfigurationError если имя пустое или повторяется, либо нет полей
     */
    explicit IndexCatalog(std::vector<IndexDefinition> definitions)
        : definitions_(std::move(definitions))
    {
        CacheConfig::validateIndexes(definitions_);
        for (size_t i = 0; i < definitions_.size(); ++i) {
            positions_.emplace(definitions_[i].name, i);
        }
    }

    bool has(const std::string& name) const {
        return positions_.count(name) > 0;
    }

    bool empty() const { return definitions_.empty(); }
    size_t size() const { return definitions_.size(); }

    const std::vector<IndexDefinition>& definitions() const {
        return definitions_;
    }

    /**
     * @throws UnknownIndex
     */
    const IndexDefinition& definition(const std::string& name) const {
        auto it = positions_.find(name);
        if (it == positions_.end()) {
            throw UnknownIndex(name);
        }
        return definitions_[it->second];
    }

    /**
     * @brief Ключ индекса по значениям полей
     * @throws UnknownIndex если индекса нет
     * @throws InvalidArgument если число значений не совпадает с числом полей
     */
    std::string resolveKey(const std::string& name,
                           const std::vector<std::string>& values) const {
        const IndexDefinition& def = definition(name);
        if (values.size() != def.fields.size()) {
            throw InvalidArgument("Index \"" + name + "\" expects " +
                                  std::to_string(def.fields.size()) + " value(s), got " +
                                  std::to_string(values.size()));
        }
        return buildKey(def.name, values);
    }

    /**
     * @brief Ключ индекса по полям записи
     * @throws InvalidArgument если в записи нет нужного поля
     */
    std::string resolveKey(const std::string& name, const FieldLookup& lookup) const {
        const IndexDefinition& def = definition(name);

        std::vector<std::string> values;
        values.reserve(def.fields.size());
        for (const auto& field : def.fields) {
            std::optional<std::string> value = lookup(field);
            if (!value) {
                throw InvalidArgument("Record has no field \"" + field +
                                      "\" required by index \"" + name + "\"");
            }
            values.push_back(std::move(*value));
        }
        return buildKey(def.name, values);
    }

    static std::string escape(const std::string& value) {
        std::string result;
        result.reserve(value.size());
        for (char c : value) {
            if (c == ESCAPE || c == SEPARATOR) {
                result.push_back(ESCAPE);
            }
            result.push_back(c);
        }
        return result;
    }

private:
    static std::string buildKey(const std::string& name,
                                const std::vector<std::string>& values) {
        std::string key = name;
        for (const auto& value : values) {
            key.push_back(SEPARATOR);
            key += escape(value);
        }
        return key;
    }

private:
    std::vector<IndexDefinition> definitions_;
    std::unordered_map<std::string, size_t> positions_;
};
