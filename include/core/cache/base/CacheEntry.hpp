#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/base/CacheValue.hpp"
#include "core/cache/quantization/QuantizationEngine.hpp"

namespace morph {
namespace core {
namespace cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief Запись кэша. Принадлежит только CacheManager.
 * @details Хранит либо исходное значение (value), либо квантизованный поток
 * (encoded + metadata). size всегда соответствует хранимому представлению.
 */
struct CacheEntry {
    std::string key;
    Value value;                        // Заполнено, если quantized == false
    std::vector<uint8_t> encoded;       // Заполнено, если quantized == true
    QuantizationMetadata metadata;
    bool quantized = false;
    QuantizationType quantizationType = QuantizationType::None;
    size_t size = 0;
    size_t originalSize = 0;
    size_t accessCount = 1;
    TimePoint lastAccessedAt;
    TimePoint createdAt;
    std::chrono::milliseconds ttl{0};
    double priority = 0.0;
    bool predictedHit = false;          // Предсказатель был уверен в попадании

    bool isExpired(TimePoint now) const { return now > createdAt + ttl; }
};

/**
 * @brief Приоритет удержания записи: чем выше, тем дольше запись живёт.
 * @details log(accessCount + 1) * 10 + max(0, 100 - минут с обращения)
 * + max(0, 50 - часов с создания).
 */
inline double computePriority(const CacheEntry& entry, TimePoint now) {
    using MinutesD = std::chrono::duration<double, std::ratio<60>>;
    using HoursD = std::chrono::duration<double, std::ratio<3600>>;

    double frequencyScore = std::log(static_cast<double>(entry.accessCount) + 1.0) * 10.0;
    double recencyScore = std::max(0.0, 100.0 - MinutesD(now - entry.lastAccessedAt).count());
    double ageScore = std::max(0.0, 50.0 - HoursD(now - entry.createdAt).count());
    return frequencyScore + recencyScore + ageScore;
}

// Строка для выдачи наиболее востребованных ключей
struct KeyUsage {
    std::string key;
    size_t accessCount = 0;
    size_t size = 0;

    nlohmann::json toJson() const {
        return {{"key", key}, {"accessCount", accessCount}, {"size", size}};
    }
};

// Снимок служебных полей записи (без значения)
struct EntryInfo {
    std::string key;
    bool quantized = false;
    QuantizationType quantizationType = QuantizationType::None;
    size_t size = 0;
    size_t originalSize = 0;
    size_t accessCount = 0;
    double priority = 0.0;
    std::chrono::milliseconds ttl{0};
    TimePoint createdAt;
    TimePoint lastAccessedAt;
};

} // namespace cache
} // namespace core
} // namespace morph
