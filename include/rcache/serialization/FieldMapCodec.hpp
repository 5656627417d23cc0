#pragma once

#include <rcache/serialization/IRecordCodec.hpp>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

/**
 * @brief Запись по умолчанию: поле -> строковое значение
 */
using FieldMap = std::map<std::string, std::string>;

/**
 * @brief Бинарный кодек для FieldMap
 *
 * Формат:
 * [4 байта: magic "RREC"]
 * [4 байта: версия формата]
 * [4 байта: количество полей]
 * [поля...]
 *
 * Формат поля:
 * [4 байта: длина имени]
 * [N байт: имя]
 * [4 байта: длина значения]
 * [M байт: значение]
 *
 * Все числа little-endian. Минимальный размер закодированной записи 12 байт,
 * поэтому результат encode() не может совпасть с негативным маркером "0".
 */
class FieldMapCodec : public IRecordCodec<FieldMap> {
public:
    static constexpr uint32_t MAGIC = 0x43455252;  // "RREC" в little-endian
    static constexpr uint32_t VERSION = 1;

    std::string encode(const FieldMap& record) const override {
        std::string result;
        result.reserve(12 + record.size() * 16);

        // Заголовок
        appendUint32(result, MAGIC);
        appendUint32(result, VERSION);
        appendUint32(result, static_cast<uint32_t>(record.size()));

        // Поля
        for (const auto& [name, value] : record) {
            appendString(result, name);
            appendString(result, value);
        }

        return result;
    }

    FieldMap decode(const std::string& data) const override {
        if (data.size() < 12) {
            throw std::runtime_error("Invalid record: too small");
        }

        size_t offset = 0;

        uint32_t magic = readUint32(data, offset);
        if (magic != MAGIC) {
            throw std::runtime_error("Invalid record: wrong magic number");
        }

        uint32_t version = readUint32(data, offset);
        if (version != VERSION) {
            throw std::runtime_error("Unsupported record version: " +
                                     std::to_string(version));
        }

        uint32_t count = readUint32(data, offset);
        FieldMap record;

        for (uint32_t i = 0; i < count; ++i) {
            std::string name = readString(data, offset);
            std::string value = readString(data, offset);
            if (!record.emplace(std::move(name), std::move(value)).second) {
                throw std::runtime_error("Invalid record: duplicate field");
            }
        }

        if (offset != data.size()) {
            throw std::runtime_error("Invalid record: trailing bytes");
        }

        return record;
    }

    std::optional<std::string> field(const FieldMap& record,
                                     const std::string& field) const override {
        auto it = record.find(field);
        if (it == record.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    // ==================== Запись ====================

    static void appendUint32(std::string& data, uint32_t value) {
        data.push_back(static_cast<char>(value & 0xFF));
        data.push_back(static_cast<char>((value >> 8) & 0xFF));
        data.push_back(static_cast<char>((value >> 16) & 0xFF));
        data.push_back(static_cast<char>((value >> 24) & 0xFF));
    }

    static void appendString(std::string& data, const std::string& value) {
        appendUint32(data, static_cast<uint32_t>(value.size()));
        data.append(value);
    }

    // ==================== Чтение ====================

    static uint32_t readUint32(const std::string& data, size_t& offset) {
        if (offset + 4 > data.size()) {
            throw std::runtime_error("Unexpected end of data");
        }

        auto byte = [&](size_t i) {
            return static_cast<uint32_t>(static_cast<unsigned char>(data[offset + i]));
        };
        uint32_t value = byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
        offset += 4;
        return value;
    }

    static std::string readString(const std::string& data, size_t& offset) {
        uint32_t size = readUint32(data, offset);
        if (offset + size > data.size()) {
            throw std::runtime_error("Unexpected end of data");
        }

        std::string value = data.substr(offset, size);
        offset += size;
        return value;
    }
};
