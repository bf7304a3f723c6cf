#pragma once

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheConfig.hpp"

namespace morph {
namespace core {
namespace cache {

enum class MemoryPressureLevel {
    Low,
    Medium,
    High,
    Critical
};

enum class PressureAction {
    None,
    Shrink,
    Evict,
    Quantize,
    EmergencyCleanup
};

const char* toString(MemoryPressureLevel level);
const char* toString(PressureAction action);

struct MemoryPressure {
    MemoryPressureLevel level = MemoryPressureLevel::Low;
    double usagePercentage = 0.0;       // Доля занятой памяти, 0..1 (может быть > 1)
    int64_t availableMemory = 0;        // Свободно байт до лимита (отрицательно при превышении)
    size_t criticalThreshold = 0;       // Граница уровня critical в байтах
    PressureAction recommendedAction = PressureAction::None;

    nlohmann::json toJson() const {
        return {
            {"level", toString(level)},
            {"usagePercentage", usagePercentage},
            {"availableMemory", availableMemory},
            {"criticalThreshold", criticalThreshold},
            {"recommendedAction", toString(recommendedAction)}
        };
    }
};

enum class ResizeDirection {
    None,
    Grow,
    Shrink
};

struct ResizeDecision {
    ResizeDirection direction = ResizeDirection::None;
    size_t newCapacity = 0;
};

/**
 * @brief Классификация давления памяти и решения об адаптивном размере.
 * @details Только вычисления, без состояния: применяет решения CacheManager.
 *
 * | Уровень  | Доля памяти   | Действие          |
 * |----------|---------------|-------------------|
 * | low      | < 0.70        | none              |
 * | medium   | [0.70, 0.85)  | quantize          |
 * | high     | [0.85, 0.95)  | evict             |
 * | critical | >= 0.95       | emergency_cleanup |
 */
class MemoryPressureMonitor {
public:
    static constexpr double kMediumThreshold = 0.70;
    static constexpr double kHighThreshold = 0.85;
    static constexpr double kCriticalThreshold = 0.95;

    // Вставка вытесняет записи, пока занято не меньше этой доли лимита
    static constexpr double kInsertHeadroom = 0.90;
    // Доля записей, вытесняемых на уровнях high и critical
    static constexpr double kPressureEvictionFraction = 0.30;
    // Доля записей, вытесняемых optimizeMemory()
    static constexpr double kOptimizeEvictionFraction = 0.20;

    static constexpr double kGrowHitRate = 0.9;
    static constexpr double kGrowUsageCeiling = 0.6;
    static constexpr double kShrinkHitRate = 0.7;

    static MemoryPressureLevel classify(double usageRatio);
    static PressureAction actionFor(MemoryPressureLevel level);
    static MemoryPressure evaluate(size_t usedBytes, size_t maxBytes);

    // Количество записей для вытеснения: floor(entryCount * fraction)
    static size_t evictionTarget(size_t entryCount, double fraction);

    /**
     * @brief Решение об изменении ёмкости.
     * @details Рост при hitRate > 0.9 и usageRatio < 0.6 (не выше policy.maxSize),
     * сжатие при hitRate < 0.7 или usageRatio > policy.resizeThreshold
     * (не ниже policy.minSize).
     */
    static ResizeDecision decideResize(double hitRate, double usageRatio, size_t capacity,
                                       const AdaptiveResizePolicy& policy);
};

} // namespace cache
} // namespace core
} // namespace morph
