#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace morph {
namespace core {
namespace cache {

/**
 * @brief Значение кэша: замкнутый набор вариантов
 * (null, bool, number, string, array, object), вложенных рекурсивно.
 * @details Все кэшируемые артефакты (результаты анализа, предложения по оптимизации)
 * приводятся к этому типу. Квантизация работает по дереву Value, а не через рефлексию.
 */
class Value {
public:
    enum class Kind : uint8_t {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}
    template<typename T,
             typename std::enable_if<std::is_arithmetic<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    Value(T value) : data_(static_cast<double>(value)) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(Array value) : data_(std::move(value)) {}
    Value(Object value) : data_(std::move(value)) {}

    Kind kind() const { return static_cast<Kind>(data_.index()); }

    bool isNull() const { return kind() == Kind::Null; }
    bool isBool() const { return kind() == Kind::Bool; }
    bool isNumber() const { return kind() == Kind::Number; }
    bool isString() const { return kind() == Kind::String; }
    bool isArray() const { return kind() == Kind::Array; }
    bool isObject() const { return kind() == Kind::Object; }

    // Доступ к содержимому. При несовпадении вида бросает std::bad_variant_access
    bool asBool() const { return std::get<bool>(data_); }
    double asNumber() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }
    const Array& asArray() const { return std::get<Array>(data_); }
    Array& asArray() { return std::get<Array>(data_); }
    const Object& asObject() const { return std::get<Object>(data_); }
    Object& asObject() { return std::get<Object>(data_); }

    /**
     * @brief Оценка занимаемой памяти в байтах.
     * @details null = 0, bool = 1, number = 8, строка = 2 байта на символ,
     * массив = сумма элементов, объект = сумма (2 * длина ключа + значение).
     */
    size_t estimatedSize() const;

    nlohmann::json toJson() const;
    static Value fromJson(const nlohmann::json& j);

    static const char* kindName(Kind kind);

    friend bool operator==(const Value& lhs, const Value& rhs) { return lhs.data_ == rhs.data_; }
    friend bool operator!=(const Value& lhs, const Value& rhs) { return !(lhs == rhs); }

private:
    std::variant<std::monostate, bool, double, std::string, Array, Object> data_;
};

} // namespace cache
} // namespace core
} // namespace morph
