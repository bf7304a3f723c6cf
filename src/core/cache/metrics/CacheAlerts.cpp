#include "core/cache/metrics/CacheAlerts.hpp"
#include <algorithm>
#include <iterator>

namespace morph {
namespace core {
namespace cache {

const char* toString(AlertType type) {
    switch (type) {
        case AlertType::MemoryPressure: return "memory_pressure";
        case AlertType::LowHitRate: return "low_hit_rate";
        case AlertType::HighEviction: return "high_eviction";
        case AlertType::QuantizationFailure: return "quantization_failure";
        case AlertType::PredictionError: return "ml_prediction_error";
    }
    return "unknown";
}

const char* toString(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::Info: return "info";
        case AlertSeverity::Warning: return "warning";
        case AlertSeverity::Error: return "error";
        case AlertSeverity::Critical: return "critical";
    }
    return "unknown";
}

nlohmann::json CacheAlert::toJson() const {
    return {
        {"type", toString(type)},
        {"severity", toString(severity)},
        {"message", message},
        {"metrics", metrics.toJson()},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch()).count()},
        {"resolved", resolved}
    };
}

void AlertHistory::push(CacheAlert alert) {
    alerts_.push_back(std::move(alert));
    while (alerts_.size() > capacity_) {
        alerts_.pop_front();
    }
}

size_t AlertHistory::resolve(AlertType type) {
    size_t resolved = 0;
    for (auto& alert : alerts_) {
        if (alert.type == type && !alert.resolved) {
            alert.resolved = true;
            ++resolved;
        }
    }
    return resolved;
}

bool AlertHistory::hasOpen(AlertType type) const {
    return std::any_of(alerts_.begin(), alerts_.end(), [type](const CacheAlert& alert) {
        return alert.type == type && !alert.resolved;
    });
}

std::vector<CacheAlert> AlertHistory::unresolved() const {
    std::vector<CacheAlert> result;
    std::copy_if(alerts_.begin(), alerts_.end(), std::back_inserter(result),
                 [](const CacheAlert& alert) { return !alert.resolved; });
    return result;
}

std::vector<CacheAlert> AlertHistory::all() const {
    return std::vector<CacheAlert>(alerts_.begin(), alerts_.end());
}

} // namespace cache
} // namespace core
} // namespace morph
