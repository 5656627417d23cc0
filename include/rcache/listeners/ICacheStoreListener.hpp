#pragma once

#include <cstddef>
#include <string>


/**
 * @brief Интерфейс слушателя событий CacheStore
 *
 * Колбэки вызываются из потока, выполняющего операцию, после того
 * как ответ хранилища классифицирован. Реализации должны быть
 * потокобезопасны: один CacheStore могут использовать несколько потоков.
 */
class ICacheStoreListener {
public:
    virtual ~ICacheStoreListener() = default;

    virtual void onHit(const std::string& key) { (void)key; }
    virtual void onMiss(const std::string& key) { (void)key; }
    virtual void onNegative(const std::string& key) { (void)key; }
    virtual void onStore(const std::string& key, size_t indexCount) {
        (void)key; (void)indexCount;
    }
    virtual void onMarkMissing(const std::string& key) { (void)key; }
    virtual void onError(const std::string& key, const std::string& message) {
        (void)key; (void)message;
    }
};
