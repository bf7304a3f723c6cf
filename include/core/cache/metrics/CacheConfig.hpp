#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/quantization/QuantizationEngine.hpp"

namespace morph {
namespace core {
namespace cache {

struct QuantizationPolicy {
    bool enabled = true;
    QuantizationType type = QuantizationType::Int8;
    size_t thresholdBytes = 1024;   // Минимальный размер значения для квантизации
    bool aggressive = false;        // Квантизовать всё, что выше порога
};

struct AdaptiveResizePolicy {
    bool enabled = true;
    size_t minSize = 1000;
    size_t maxSize = 50000;
    double resizeThreshold = 0.8;   // Доля памяти, выше которой ёмкость сжимается
    double shrinkFactor = 0.7;
    double growthFactor = 1.3;
    std::chrono::milliseconds resizeInterval{600000};
};

struct PredictionPolicy {
    bool enabled = true;
    std::chrono::milliseconds predictionWindow{3600000};
    double confidenceThreshold = 0.7;
};

struct AlertThresholds {
    double hitRate = 0.8;       // Алерт, если доля попаданий ниже
    double memoryUsage = 0.9;   // Алерт, если доля занятой памяти выше
    double evictionRate = 0.1;  // Алерт, если вытеснений на запрос больше
};

struct MonitoringPolicy {
    bool enabled = true;
    std::chrono::milliseconds metricsInterval{60000};
    AlertThresholds alertThresholds;
};

// Унифицированная конфигурация кэша
struct CacheConfiguration {
    size_t maxSize = 10000;                         // Максимум записей
    size_t maxMemoryMB = 512;                       // Лимит памяти
    std::chrono::milliseconds defaultTTL{3600000};  // TTL по умолчанию
    QuantizationPolicy quantization;
    AdaptiveResizePolicy adaptiveResize;
    PredictionPolicy mlPrediction;
    MonitoringPolicy monitoring;

    size_t maxMemoryBytes() const { return maxMemoryMB * 1024 * 1024; }

    /**
     * @brief Проверка конфигурации.
     * @return Пустая строка, если конфигурация корректна, иначе описание первого нарушения
     */
    std::string validationError() const;

    bool validate() const { return validationError().empty(); }

    nlohmann::json toJson() const;

    /**
     * @brief Разбор конфигурации из JSON.
     * @details Отсутствующие поля берутся из значений по умолчанию. Принимаются
     * устаревшие имена threshold, predictionWindow и metricsInterval.
     * @throws nlohmann::json::exception при неверных типах полей,
     *         std::invalid_argument при неизвестном типе квантизации
     */
    static CacheConfiguration fromJson(const nlohmann::json& j);

    /**
     * @brief Загрузка конфигурации из JSON-файла.
     * @throws std::runtime_error если файл не читается или содержит неверный JSON
     */
    static CacheConfiguration loadFromFile(const std::string& path);
};

} // namespace cache
} // namespace core
} // namespace morph
