#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Иерархия исключений rcache
 *
 * Ошибки конфигурации и неверные аргументы: наследники std::invalid_argument,
 * ошибки обмена с хранилищем и декодирования: наследники std::runtime_error.
 *
 * Промахи кэша (Absent, Negative) исключениями не являются:
 * это обычные результаты FetchResult.
 */

/**
 * @brief Некорректная конфигурация кэша
 *
 * Бросается только из конструкторов. path() указывает на проблемное поле,
 * например "indexes[1].fields".
 */
class ConfigurationError : public std::invalid_argument {
public:
    ConfigurationError(const std::string& path, const std::string& message)
        : std::invalid_argument(path + ": " + message)
        , path_(path)
    {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Обращение к индексу, которого нет в каталоге
 */
class UnknownIndex : public std::invalid_argument {
public:
    explicit UnknownIndex(const std::string& index)
        : std::invalid_argument("No such index \"" + index + "\"")
        , index_(index)
    {}

    const std::string& index() const { return index_; }

private:
    std::string index_;
};

/**
 * @brief Нарушение контракта fetch/store (кортеж без индекса, не та арность и т.п.)
 */
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Любой сбой соединения с хранилищем: сеть, таймаут, протокол, error reply
 *
 * Пробрасывается вызывающему без повторов.
 */
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Сохранённые байты не удалось декодировать в запись
 */
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& key, const std::string& message)
        : std::runtime_error("Failed to decode \"" + key + "\": " + message)
        , key_(key)
    {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};
