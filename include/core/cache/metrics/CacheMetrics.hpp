#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>

namespace morph {
namespace core {
namespace cache {

struct CacheMetrics {
    size_t hits = 0;                  // Попадания
    size_t misses = 0;                // Промахи (включая истёкшие записи)
    size_t evictions = 0;             // Вытеснения
    size_t quantizations = 0;         // Применённые квантизации
    size_t quantizationErrors = 0;    // Неудачные квантизации и повреждённые потоки
    size_t trainingFailures = 0;      // Неудачные обучения предсказателя
    size_t totalRequests = 0;         // Вызовы get и set
    size_t memoryUsage = 0;           // Сумма размеров записей (байт)
    size_t entryCount = 0;            // Количество записей
    size_t capacity = 0;              // Текущая ёмкость (записей)
    double averageEntrySize = 0.0;
    double hitRate = 0.0;             // hits / (hits + misses), за всё время
    double evictionRate = 0.0;        // evictions / totalRequests
    double compressionRatio = 1.0;    // Сумма исходных размеров / сумма хранимых
    double memoryEfficiency = 1.0;
    double averageAccessTimeMs = 0.0; // Скользящее среднее времени get/set
    size_t predictedHits = 0;         // Записи с уверенным предсказанием попадания
    double mlAccuracy = 0.0;          // Доля подтвердившихся уверенных предсказаний

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"quantizations", quantizations},
            {"quantizationErrors", quantizationErrors},
            {"trainingFailures", trainingFailures},
            {"totalRequests", totalRequests},
            {"memoryUsage", memoryUsage},
            {"entryCount", entryCount},
            {"capacity", capacity},
            {"averageEntrySize", averageEntrySize},
            {"hitRate", hitRate},
            {"evictionRate", evictionRate},
            {"compressionRatio", compressionRatio},
            {"memoryEfficiency", memoryEfficiency},
            {"averageAccessTimeMs", averageAccessTimeMs},
            {"predictedHits", predictedHits},
            {"mlAccuracy", mlAccuracy}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace morph
