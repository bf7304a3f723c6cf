#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/base/CacheEntry.hpp"
#include "core/cache/base/CacheValue.hpp"
#include "core/cache/dynamic/MemoryPressureMonitor.hpp"
#include "core/cache/metrics/CacheAlerts.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/cache/metrics/CacheMetrics.hpp"

namespace morph {
namespace core {
namespace cache {

// Результат принудительной оптимизации памяти
struct OptimizationResult {
    size_t entriesEvicted = 0;
    int64_t memoryFreed = 0;
    size_t quantizationsApplied = 0;

    nlohmann::json toJson() const {
        return {
            {"entriesEvicted", entriesEvicted},
            {"memoryFreed", memoryFreed},
            {"quantizationsApplied", quantizationsApplied}
        };
    }
};

// Итог одного такта обслуживания
struct MaintenanceReport {
    size_t expiredRemoved = 0;
    size_t entriesEvicted = 0;
    size_t quantizationsApplied = 0;
    MemoryPressureLevel pressureLevel = MemoryPressureLevel::Low;
    ResizeDirection resize = ResizeDirection::None;
    size_t capacityBefore = 0;
    size_t capacityAfter = 0;
    bool predictorTrained = false;
    size_t predictorKeysPruned = 0;
    size_t alertsRaised = 0;
};

/**
 * @brief Адаптивный квантизующий KV-кэш.
 *
 * Хранит артефакты дорогого конвейера анализа по ключу-отпечатку.
 * Ограничивает число записей и память, сжимает значения квантизацией,
 * вытесняет записи с наименьшим приоритетом и подстраивает ёмкость
 * по доле попаданий и давлению памяти.
 *
 * @note Потокобезопасен: таблица и счётчики защищены одним shared_mutex.
 * Такт обслуживания (очистка истёкших, давление памяти, изменение ёмкости,
 * обучение предсказателя, алерты) выполняется на отдельном потоке,
 * если monitoring.enabled, либо вызовом runMaintenance().
 */
class CacheManager : public BaseCache<std::string, Value> {
public:
    using TimeSource = std::function<TimePoint()>;
    using EvictionCallback = std::function<void(const std::string& key, double priority)>;
    using AlertCallback = std::function<void(const CacheAlert& alert)>;

    /**
     * @brief Конструктор
     * @param config Конфигурация кэша
     * @param name Имя пространства кэша (для логов и экспорта)
     * @param timeSource Источник времени; по умолчанию system_clock::now
     * @throws std::invalid_argument при некорректной конфигурации
     */
    explicit CacheManager(const CacheConfiguration& config = CacheConfiguration{},
                          std::string name = "default",
                          TimeSource timeSource = TimeSource{});

    // Деструктор вызывает shutdown()
    ~CacheManager() override;

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::optional<Value> get(const std::string& key) override;
    bool set(const std::string& key, const Value& value) override;
    bool set(const std::string& key, const Value& value, std::chrono::milliseconds ttl) override;
    bool has(const std::string& key) const override;
    bool remove(const std::string& key) override;
    // Счётчики попаданий, промахов и вытеснений не сбрасываются
    void clear() override;
    size_t size() const override;

    // Текущая ёмкость по числу записей (меняется адаптивно)
    size_t capacity() const;

    std::optional<EntryInfo> getEntryInfo(const std::string& key) const;
    std::vector<KeyUsage> getTopKeys(size_t limit) const;

    // Вероятность попадания по ключу, в [0, 1]
    double predictHit(const std::string& key) const;

    CacheMetrics getMetrics() const;
    MemoryPressure getMemoryPressure() const;
    // Нерешённые алерты
    std::vector<CacheAlert> getAlerts() const;
    // Все сохранённые алерты, включая решённые
    std::vector<CacheAlert> getAlertHistory() const;

    CacheConfiguration getConfiguration() const;

    /**
     * @brief Заменить конфигурацию целиком.
     * @throws std::invalid_argument если конфигурация некорректна; прежняя сохраняется
     */
    void updateConfiguration(const CacheConfiguration& config);

    /**
     * @brief Принудительная оптимизация памяти.
     * @details Квантизует крупные неквантизованные записи (даже если квантизация
     * выключена) и вытесняет 20% записей с наименьшим приоритетом.
     */
    OptimizationResult optimizeMemory();

    // Один такт обслуживания, синхронно
    MaintenanceReport runMaintenance();

    // JSON-снимок состояния без побочных эффектов
    nlohmann::json statistics() const;
    std::string exportStatistics() const;

    void setEvictionCallback(EvictionCallback callback);
    void setAlertCallback(AlertCallback callback);

    const std::string& name() const;
    bool isRunning() const;

    // Остановка таймера и освобождение всех записей. Идемпотентна
    void shutdown();

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace cache
} // namespace core
} // namespace morph
