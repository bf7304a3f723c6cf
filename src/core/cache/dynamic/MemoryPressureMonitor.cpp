#include "core/cache/dynamic/MemoryPressureMonitor.hpp"
#include <algorithm>
#include <cmath>

namespace morph {
namespace core {
namespace cache {

const char* toString(MemoryPressureLevel level) {
    switch (level) {
        case MemoryPressureLevel::Low: return "low";
        case MemoryPressureLevel::Medium: return "medium";
        case MemoryPressureLevel::High: return "high";
        case MemoryPressureLevel::Critical: return "critical";
    }
    return "low";
}

const char* toString(PressureAction action) {
    switch (action) {
        case PressureAction::None: return "none";
        case PressureAction::Shrink: return "shrink";
        case PressureAction::Evict: return "evict";
        case PressureAction::Quantize: return "quantize";
        case PressureAction::EmergencyCleanup: return "emergency_cleanup";
    }
    return "none";
}

MemoryPressureLevel MemoryPressureMonitor::classify(double usageRatio) {
    if (usageRatio >= kCriticalThreshold) return MemoryPressureLevel::Critical;
    if (usageRatio >= kHighThreshold) return MemoryPressureLevel::High;
    if (usageRatio >= kMediumThreshold) return MemoryPressureLevel::Medium;
    return MemoryPressureLevel::Low;
}

PressureAction MemoryPressureMonitor::actionFor(MemoryPressureLevel level) {
    switch (level) {
        case MemoryPressureLevel::Low: return PressureAction::None;
        case MemoryPressureLevel::Medium: return PressureAction::Quantize;
        case MemoryPressureLevel::High: return PressureAction::Evict;
        case MemoryPressureLevel::Critical: return PressureAction::EmergencyCleanup;
    }
    return PressureAction::None;
}

MemoryPressure MemoryPressureMonitor::evaluate(size_t usedBytes, size_t maxBytes) {
    MemoryPressure pressure;
    pressure.usagePercentage = maxBytes > 0 ? static_cast<double>(usedBytes) / maxBytes : 1.0;
    pressure.level = classify(pressure.usagePercentage);
    pressure.availableMemory = static_cast<int64_t>(maxBytes) - static_cast<int64_t>(usedBytes);
    pressure.criticalThreshold = static_cast<size_t>(maxBytes * kCriticalThreshold);
    pressure.recommendedAction = actionFor(pressure.level);
    return pressure;
}

size_t MemoryPressureMonitor::evictionTarget(size_t entryCount, double fraction) {
    return static_cast<size_t>(std::floor(entryCount * fraction));
}

ResizeDecision MemoryPressureMonitor::decideResize(double hitRate, double usageRatio, size_t capacity,
                                                   const AdaptiveResizePolicy& policy) {
    ResizeDecision decision;
    decision.newCapacity = capacity;

    if (hitRate > kGrowHitRate && usageRatio < kGrowUsageCeiling) {
        size_t grown = std::min(policy.maxSize,
                                static_cast<size_t>(std::floor(capacity * policy.growthFactor)));
        if (grown > capacity) {
            decision.direction = ResizeDirection::Grow;
            decision.newCapacity = grown;
        }
    } else if (hitRate < kShrinkHitRate || usageRatio > policy.resizeThreshold) {
        size_t shrunk = std::max(policy.minSize,
                                 static_cast<size_t>(std::floor(capacity * policy.shrinkFactor)));
        if (shrunk < capacity) {
            decision.direction = ResizeDirection::Shrink;
            decision.newCapacity = shrunk;
        }
    }
    return decision;
}

} // namespace cache
} // namespace core
} // namespace morph
