#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

namespace morph {
namespace core {
namespace cache {

/**
 * @brief Базовый шаблонный интерфейс кэша.
 * @tparam Key Тип ключа (например, std::string)
 * @tparam Value Тип значения (например, cache::Value)
 */
template<typename Key, typename Value>
class BaseCache {
public:
    virtual ~BaseCache() = default;
    /// Получить значение по ключу. Отсутствие или истёкший TTL дают std::nullopt.
    virtual std::optional<Value> get(const Key& key) = 0;
    /// Сохранить значение с TTL по умолчанию.
    virtual bool set(const Key& key, const Value& value) = 0;
    /// Сохранить значение с явным TTL.
    virtual bool set(const Key& key, const Value& value, std::chrono::milliseconds ttl) = 0;
    /// Есть ли неистёкшая запись.
    virtual bool has(const Key& key) const = 0;
    /// Удалить значение по ключу. Возвращает true, если запись была.
    virtual bool remove(const Key& key) = 0;
    /// Очистить кэш полностью.
    virtual void clear() = 0;
    /// Получить количество элементов в кэше.
    virtual size_t size() const = 0;
};

} // namespace cache
} // namespace core
} // namespace morph
