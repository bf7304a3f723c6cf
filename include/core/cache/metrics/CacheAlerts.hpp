#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheMetrics.hpp"

namespace morph {
namespace core {
namespace cache {

enum class AlertType {
    MemoryPressure,
    LowHitRate,
    HighEviction,
    QuantizationFailure,
    PredictionError
};

enum class AlertSeverity {
    Info,
    Warning,
    Error,
    Critical
};

const char* toString(AlertType type);
const char* toString(AlertSeverity severity);

struct CacheAlert {
    AlertType type = AlertType::MemoryPressure;
    AlertSeverity severity = AlertSeverity::Info;
    std::string message;
    CacheMetrics metrics;                               // Снимок метрик на момент алерта
    std::chrono::system_clock::time_point timestamp;
    bool resolved = false;

    nlohmann::json toJson() const;
};

/**
 * @brief История алертов фиксированной ёмкости.
 * @details При превышении ёмкости отбрасывается самый старый алерт.
 * Не потокобезопасна, защищается блокировкой владельца.
 */
class AlertHistory {
public:
    static constexpr size_t kDefaultCapacity = 100;

    explicit AlertHistory(size_t capacity = kDefaultCapacity) : capacity_(capacity) {}

    void push(CacheAlert alert);

    // Пометить открытые алерты данного типа решёнными, возвращает их число
    size_t resolve(AlertType type);

    bool hasOpen(AlertType type) const;
    std::vector<CacheAlert> unresolved() const;
    std::vector<CacheAlert> all() const;
    size_t size() const { return alerts_.size(); }
    size_t capacity() const { return capacity_; }
    void clear() { alerts_.clear(); }

private:
    size_t capacity_;
    std::deque<CacheAlert> alerts_;
};

} // namespace cache
} // namespace core
} // namespace morph
