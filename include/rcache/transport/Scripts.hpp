#pragma once

#include <rcache/transport/IConnection.hpp>

/**
 * @brief Разрешение вторичного ключа: KEYS[1] -> первичный id -> значение
 *
 * Если индексной записи нет, возвращает nil, не обращаясь к GET с пустым ключом.
 */
inline const LuaScript& getSecondaryScript() {
    static const LuaScript script{
        "get_secondary",
        "local primary = redis.call('GET', KEYS[1])\n"
        "if not primary then\n"
        "  return false\n"
        "end\n"
        "return redis.call('GET', primary)\n"
    };
    return script;
}
