#pragma once

#include <optional>
#include <string>

/**
 * @brief Интерфейс кодирования записей для хранения в кэше
 * @tparam V Тип записи
 *
 * Отвечает за преобразование записи в байты и обратно, а также
 * за чтение значений полей для построения ключей вторичных индексов.
 * Не знает о сети и ключах кэша: только формат данных.
 *
 * Требование к реализациям: encode() никогда не должен возвращать "0":
 * это значение зарезервировано под негативный маркер.
 *
 * Реализации:
 * - FieldMapCodec: бинарный формат для FieldMap
 */
template<typename V>
class IRecordCodec {
public:
    virtual ~IRecordCodec() = default;

    /**
     * @brief Закодировать запись
     * @param record Запись
     * @return Байтовое представление
     */
    virtual std::string encode(const V& record) const = 0;

    /**
     * @brief Декодировать запись
     * @param data Байтовое представление
     * @return Запись
     * @throws std::exception если данные повреждены (CacheStore оборачивает в DecodeError)
     */
    virtual V decode(const std::string& data) const = 0;

    /**
     * @brief Значение поля записи в строковом виде
     * @param record Запись
     * @param field Имя поля
     * @return Значение или std::nullopt если поля нет
     */
    virtual std::optional<std::string> field(const V& record,
                                             const std::string& field) const = 0;
};
