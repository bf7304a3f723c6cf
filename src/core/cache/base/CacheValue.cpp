#include "core/cache/base/CacheValue.hpp"
#include <stdexcept>

namespace morph {
namespace core {
namespace cache {

size_t Value::estimatedSize() const {
    switch (kind()) {
        case Kind::Null:
            return 0;
        case Kind::Bool:
            return 1;
        case Kind::Number:
            return 8;
        case Kind::String:
            return asString().size() * 2;
        case Kind::Array: {
            size_t total = 0;
            for (const auto& item : asArray()) {
                total += item.estimatedSize();
            }
            return total;
        }
        case Kind::Object: {
            size_t total = 0;
            for (const auto& [key, item] : asObject()) {
                total += key.size() * 2 + item.estimatedSize();
            }
            return total;
        }
    }
    return 0;
}

nlohmann::json Value::toJson() const {
    switch (kind()) {
        case Kind::Null:
            return nullptr;
        case Kind::Bool:
            return asBool();
        case Kind::Number:
            return asNumber();
        case Kind::String:
            return asString();
        case Kind::Array: {
            nlohmann::json result = nlohmann::json::array();
            for (const auto& item : asArray()) {
                result.push_back(item.toJson());
            }
            return result;
        }
        case Kind::Object: {
            nlohmann::json result = nlohmann::json::object();
            for (const auto& [key, item] : asObject()) {
                result[key] = item.toJson();
            }
            return result;
        }
    }
    return nullptr;
}

Value Value::fromJson(const nlohmann::json& j) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::json::value_t::string:
            return Value(j.get<std::string>());
        case nlohmann::json::value_t::array: {
            Array items;
            items.reserve(j.size());
            for (const auto& item : j) {
                items.push_back(fromJson(item));
            }
            return Value(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            Object fields;
            for (auto it = j.begin(); it != j.end(); ++it) {
                fields.emplace(it.key(), fromJson(it.value()));
            }
            return Value(std::move(fields));
        }
        default:
            // binary и discarded не входят в модель значений
            throw std::invalid_argument(std::string("Unsupported JSON value type: ") + j.type_name());
    }
}

const char* Value::kindName(Kind kind) {
    switch (kind) {
        case Kind::Null: return "null";
        case Kind::Bool: return "bool";
        case Kind::Number: return "number";
        case Kind::String: return "string";
        case Kind::Array: return "array";
        case Kind::Object: return "object";
    }
    return "unknown";
}

} // namespace cache
} // namespace core
} // namespace morph
