#include "core/cache/metrics/CacheConfig.hpp"
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace morph {
namespace core {
namespace cache {

namespace {

bool isRatio(double value) {
    return value >= 0.0 && value <= 1.0;
}

std::chrono::milliseconds millisField(const nlohmann::json& j, const char* name, const char* legacyName,
                                      std::chrono::milliseconds fallback) {
    if (j.contains(name)) {
        return std::chrono::milliseconds(j.at(name).get<int64_t>());
    }
    if (legacyName && j.contains(legacyName)) {
        return std::chrono::milliseconds(j.at(legacyName).get<int64_t>());
    }
    return fallback;
}

} // namespace

std::string CacheConfiguration::validationError() const {
    if (maxSize == 0) return "maxSize must be positive";
    if (maxMemoryMB == 0) return "maxMemoryMB must be positive";
    if (defaultTTL.count() <= 0) return "defaultTTL must be positive";

    if (adaptiveResize.minSize == 0) return "adaptiveResize.minSize must be positive";
    if (adaptiveResize.minSize > adaptiveResize.maxSize) return "adaptiveResize.minSize exceeds adaptiveResize.maxSize";
    // NaN не проходит ни одну из проверок ниже
    const double resizeThreshold = adaptiveResize.resizeThreshold;
    if (!(resizeThreshold > 0.0 && resizeThreshold <= 1.0)) {
        return "adaptiveResize.resizeThreshold must be in (0, 1]";
    }
    const double shrinkFactor = adaptiveResize.shrinkFactor;
    if (!(shrinkFactor > 0.0 && shrinkFactor < 1.0)) {
        return "adaptiveResize.shrinkFactor must be in (0, 1)";
    }
    const double growthFactor = adaptiveResize.growthFactor;
    if (!(std::isfinite(growthFactor) && growthFactor > 1.0)) {
        return "adaptiveResize.growthFactor must be a finite number greater than 1";
    }
    if (adaptiveResize.resizeInterval.count() < 0) return "adaptiveResize.resizeIntervalMs must not be negative";

    if (mlPrediction.predictionWindow.count() <= 0) return "mlPrediction.predictionWindowMs must be positive";
    if (!isRatio(mlPrediction.confidenceThreshold)) return "mlPrediction.confidenceThreshold must be in [0, 1]";

    if (monitoring.metricsInterval.count() <= 0) return "monitoring.metricsIntervalMs must be positive";
    if (!isRatio(monitoring.alertThresholds.hitRate)) return "monitoring.alertThresholds.hitRate must be in [0, 1]";
    if (!isRatio(monitoring.alertThresholds.memoryUsage)) {
        return "monitoring.alertThresholds.memoryUsage must be in [0, 1]";
    }
    const double evictionRate = monitoring.alertThresholds.evictionRate;
    if (!(std::isfinite(evictionRate) && evictionRate >= 0.0)) {
        return "monitoring.alertThresholds.evictionRate must be a finite non-negative number";
    }
    return {};
}

nlohmann::json CacheConfiguration::toJson() const {
    return {
        {"maxSize", maxSize},
        {"maxMemoryMB", maxMemoryMB},
        {"defaultTTL", defaultTTL.count()},
        {"quantization", {
            {"enabled", quantization.enabled},
            {"type", toString(quantization.type)},
            {"thresholdBytes", quantization.thresholdBytes},
            {"aggressive", quantization.aggressive}
        }},
        {"adaptiveResize", {
            {"enabled", adaptiveResize.enabled},
            {"minSize", adaptiveResize.minSize},
            {"maxSize", adaptiveResize.maxSize},
            {"resizeThreshold", adaptiveResize.resizeThreshold},
            {"shrinkFactor", adaptiveResize.shrinkFactor},
            {"growthFactor", adaptiveResize.growthFactor},
            {"resizeIntervalMs", adaptiveResize.resizeInterval.count()}
        }},
        {"mlPrediction", {
            {"enabled", mlPrediction.enabled},
            {"predictionWindowMs", mlPrediction.predictionWindow.count()},
            {"confidenceThreshold", mlPrediction.confidenceThreshold}
        }},
        {"monitoring", {
            {"enabled", monitoring.enabled},
            {"metricsIntervalMs", monitoring.metricsInterval.count()},
            {"alertThresholds", {
                {"hitRate", monitoring.alertThresholds.hitRate},
                {"memoryUsage", monitoring.alertThresholds.memoryUsage},
                {"evictionRate", monitoring.alertThresholds.evictionRate}
            }}
        }}
    };
}

CacheConfiguration CacheConfiguration::fromJson(const nlohmann::json& j) {
    CacheConfiguration config;
    config.maxSize = j.value("maxSize", config.maxSize);
    config.maxMemoryMB = j.value("maxMemoryMB", config.maxMemoryMB);
    config.defaultTTL = millisField(j, "defaultTTL", nullptr, config.defaultTTL);

    if (j.contains("quantization")) {
        const auto& q = j.at("quantization");
        config.quantization.enabled = q.value("enabled", config.quantization.enabled);
        if (q.contains("type")) {
            config.quantization.type = quantizationTypeFromString(q.at("type").get<std::string>());
        }
        config.quantization.thresholdBytes = q.value("thresholdBytes",
            q.value("threshold", config.quantization.thresholdBytes));
        config.quantization.aggressive = q.value("aggressive", config.quantization.aggressive);
    }

    if (j.contains("adaptiveResize")) {
        const auto& a = j.at("adaptiveResize");
        auto& policy = config.adaptiveResize;
        policy.enabled = a.value("enabled", policy.enabled);
        policy.minSize = a.value("minSize", policy.minSize);
        policy.maxSize = a.value("maxSize", policy.maxSize);
        policy.resizeThreshold = a.value("resizeThreshold", policy.resizeThreshold);
        policy.shrinkFactor = a.value("shrinkFactor", policy.shrinkFactor);
        policy.growthFactor = a.value("growthFactor", policy.growthFactor);
        policy.resizeInterval = millisField(a, "resizeIntervalMs", nullptr, policy.resizeInterval);
    }

    if (j.contains("mlPrediction")) {
        const auto& m = j.at("mlPrediction");
        config.mlPrediction.enabled = m.value("enabled", config.mlPrediction.enabled);
        config.mlPrediction.predictionWindow = millisField(m, "predictionWindowMs", "predictionWindow",
                                                           config.mlPrediction.predictionWindow);
        config.mlPrediction.confidenceThreshold = m.value("confidenceThreshold",
                                                          config.mlPrediction.confidenceThreshold);
    }

    if (j.contains("monitoring")) {
        const auto& m = j.at("monitoring");
        config.monitoring.enabled = m.value("enabled", config.monitoring.enabled);
        config.monitoring.metricsInterval = millisField(m, "metricsIntervalMs", "metricsInterval",
                                                        config.monitoring.metricsInterval);
        if (m.contains("alertThresholds")) {
            const auto& t = m.at("alertThresholds");
            auto& thresholds = config.monitoring.alertThresholds;
            thresholds.hitRate = t.value("hitRate", thresholds.hitRate);
            thresholds.memoryUsage = t.value("memoryUsage", thresholds.memoryUsage);
            thresholds.evictionRate = t.value("evictionRate", thresholds.evictionRate);
        }
    }
    return config;
}

CacheConfiguration CacheConfiguration::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open cache configuration: " + path);
    }
    try {
        nlohmann::json j;
        file >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Malformed cache configuration " + path + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Malformed cache configuration " + path + ": " + e.what());
    }
}

} // namespace cache
} // namespace core
} // namespace morph
