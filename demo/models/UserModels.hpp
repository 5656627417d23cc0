#pragma once

#include <rcache/serialization/FieldMapCodec.hpp>
#include <rcache/serialization/IRecordCodec.hpp>
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief Модели данных справочника пользователей
 *
 * Запись кэшируется под первичным id и находится по email
 * через вторичный индекс "by_email".
 */

/**
 * @brief Пользователь
 *
 * Меняется редко: при смене профиля или email.
 * Рекомендуемый TTL для кэширования: 5-15 минут
 */
struct User {
    std::string id;                 // "u-1001"
    std::string email;              // "anna@example.com"
    std::string name;               // "Anna Petrova"
    std::string country;            // "RU"

    bool operator==(const User& other) const {
        return id == other.id && email == other.email &&
               name == other.name && country == other.country;
    }
};

/**
 * @brief Кодек User поверх FieldMapCodec
 *
 * Поля индексов берутся из тех же имён, что и в FieldMap.
 */
class UserCodec : public IRecordCodec<User> {
public:
    std::string encode(const User& user) const override {
        return fields_.encode(toFields(user));
    }

    User decode(const std::string& data) const override {
        FieldMap fields = fields_.decode(data);
        User user;
        user.id = require(fields, "id");
        user.email = require(fields, "email");
        user.name = require(fields, "name");
        user.country = require(fields, "country");
        return user;
    }

    std::optional<std::string> field(const User& user, const std::string& name) const override {
        return fields_.field(toFields(user), name);
    }

private:
    static FieldMap toFields(const User& user) {
        return FieldMap{
            {"id", user.id},
            {"email", user.email},
            {"name", user.name},
            {"country", user.country},
        };
    }

    static std::string require(const FieldMap& fields, const std::string& name) {
        auto it = fields.find(name);
        if (it == fields.end()) {
            throw std::runtime_error("User record has no field: " + name);
        }
        return it->second;
    }

    FieldMapCodec fields_;
};
