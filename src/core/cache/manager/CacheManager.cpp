#include "core/cache/manager/CacheManager.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include "core/cache/prediction/HitPredictor.hpp"
#include "core/cache/quantization/QuantizationEngine.hpp"
#include "core/logging/LoggerFactory.hpp"
#include "core/thread/PeriodicTask.hpp"

namespace morph {
namespace core {
namespace cache {

namespace {

// Ключей на одно захватывание блокировки при очистке истёкших записей
constexpr size_t kExpirySweepChunk = 256;
constexpr size_t kExportTopKeys = 10;

// Вытесненные записи: ключ и приоритет на момент вытеснения
using EvictedList = std::vector<std::pair<std::string, double>>;

prediction::PredictorConfig toPredictorConfig(const PredictionPolicy& policy) {
    prediction::PredictorConfig config;
    config.enabled = policy.enabled;
    config.predictionWindow = policy.predictionWindow;
    config.confidenceThreshold = policy.confidenceThreshold;
    return config;
}

std::string formatTimestamp(TimePoint tp) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::time_t seconds = Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}

} // namespace

// Реализация PIMPL
struct CacheManager::Impl {
    struct PressureOutcome {
        size_t evicted = 0;
        size_t quantized = 0;
        size_t expired = 0;
    };

    std::string name;
    CacheConfiguration config;
    size_t capacity;
    TimeSource timeSource;
    std::shared_ptr<spdlog::logger> logger;

    mutable std::shared_mutex mutex;                        // Таблица и счётчики
    std::unordered_map<std::string, CacheEntry> entries;
    size_t memoryUsage = 0;
    size_t originalTotal = 0;

    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
    size_t quantizations = 0;
    size_t decodeErrors = 0;                                // Повреждённые потоки при чтении
    size_t totalRequests = 0;
    size_t predictedHits = 0;
    size_t confirmedPredictions = 0;
    double averageAccessTimeMs = 0.0;

    QuantizationEngine quantizer;
    prediction::HitPredictor predictor;
    AlertHistory alerts;
    size_t reportedQuantizationErrors = 0;
    size_t reportedTrainingFailures = 0;
    TimePoint lastResize;

    std::mutex callbackMutex;
    EvictionCallback onEviction;
    AlertCallback onAlert;

    std::atomic<bool> stopped{false};
    thread::PeriodicTask maintenance;

    Impl(const CacheConfiguration& cfg, std::string cacheName, TimeSource source)
        : name(std::move(cacheName))
        , config(cfg)
        , capacity(cfg.maxSize)
        , timeSource(source ? std::move(source) : TimeSource([] { return Clock::now(); }))
        , logger(logging::LoggerFactory::get("kvcache"))
        , predictor(toPredictorConfig(cfg.mlPrediction))
        , maintenance("kvcache-" + name) {
        lastResize = timeSource();
    }

    TimePoint now() const { return timeSource(); }

    // Может вызываться из обработчиков на потоке обслуживания
    void startTicker(CacheManager* owner, const MonitoringPolicy& monitoring) {
        if (monitoring.enabled && !stopped) {
            maintenance.restart(monitoring.metricsInterval, [owner] { owner->runMaintenance(); });
        } else {
            maintenance.stop();
        }
    }

    void recordAccessTime(std::chrono::steady_clock::time_point started) {
        double elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        averageAccessTimeMs = (averageAccessTimeMs + elapsed) / 2.0;
    }

    void account(const CacheEntry& entry) {
        memoryUsage += entry.size;
        originalTotal += entry.originalSize;
    }

    void unaccount(const CacheEntry& entry) {
        memoryUsage -= std::min(memoryUsage, entry.size);
        originalTotal -= std::min(originalTotal, entry.originalSize);
    }

    double hitRate() const {
        size_t lookups = hits + misses;
        return lookups > 0 ? static_cast<double>(hits) / lookups : 0.0;
    }

    double usageRatio() const {
        size_t maxBytes = config.maxMemoryBytes();
        return maxBytes > 0 ? static_cast<double>(memoryUsage) / maxBytes : 1.0;
    }

    // Вытеснить запись с наименьшим приоритетом
    bool evictLowest(EvictedList& evicted) {
        if (entries.empty()) {
            return false;
        }
        auto victim = entries.begin();
        for (auto it = std::next(entries.begin()); it != entries.end(); ++it) {
            const CacheEntry& candidate = it->second;
            const CacheEntry& current = victim->second;
            if (candidate.priority != current.priority) {
                if (candidate.priority < current.priority) victim = it;
            } else if (candidate.lastAccessedAt != current.lastAccessedAt) {
                if (candidate.lastAccessedAt < current.lastAccessedAt) victim = it;
            } else if (candidate.key < current.key) {
                victim = it;
            }
        }

        logger->debug("[{}] Evicting key={}, priority={:.2f}", name, victim->first, victim->second.priority);
        evicted.emplace_back(victim->first, victim->second.priority);
        unaccount(victim->second);
        predictor.forget(victim->first);
        entries.erase(victim);
        ++evictions;
        return true;
    }

    size_t evictCount(size_t count, EvictedList& evicted) {
        size_t removed = 0;
        while (removed < count && evictLowest(evicted)) {
            ++removed;
        }
        return removed;
    }

    size_t purgeExpired(TimePoint now) {
        size_t removed = 0;
        for (auto it = entries.begin(); it != entries.end();) {
            if (it->second.isExpired(now)) {
                unaccount(it->second);
                predictor.forget(it->first);
                it = entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    // Исходное значение записи. Бросает QuantizationError для повреждённого потока
    Value materialize(const CacheEntry& entry) const {
        if (!entry.quantized) {
            return entry.value;
        }
        return quantizer.dequantize(entry.encoded, entry.metadata);
    }

    bool shouldQuantize(size_t originalSize, MemoryPressureLevel level) const {
        const QuantizationPolicy& policy = config.quantization;
        if (!policy.enabled || policy.type == QuantizationType::None || originalSize < policy.thresholdBytes) {
            return false;
        }
        return level == MemoryPressureLevel::High || level == MemoryPressureLevel::Critical ||
               policy.aggressive || originalSize > 2 * policy.thresholdBytes;
    }

    QuantizationType fallbackType() const {
        return config.quantization.type == QuantizationType::None ? QuantizationType::Int8
                                                                  : config.quantization.type;
    }

    // Перекодировать запись в другой тип квантизации
    bool requantize(CacheEntry& entry, QuantizationType type) {
        if (type == QuantizationType::None) {
            return false;
        }
        Value raw;
        try {
            raw = materialize(entry);
        } catch (const QuantizationError& e) {
            ++decodeErrors;
            logger->warn("[{}] Cannot requantize key={}: {}", name, entry.key, e.what());
            return false;
        }

        QuantizedValue encoded = quantizer.quantize(raw, type);
        if (!encoded.quantized()) {
            return false;
        }
        unaccount(entry);
        entry.encoded = std::move(encoded.bytes);
        entry.metadata = std::move(encoded.metadata);
        entry.quantized = true;
        entry.quantizationType = type;
        entry.value = Value();
        entry.size = entry.metadata.encodedSize;
        account(entry);
        ++quantizations;
        return true;
    }

    PressureOutcome respondToPressure(const MemoryPressure& pressure, TimePoint now, EvictedList& evicted) {
        PressureOutcome outcome;
        const QuantizationPolicy& policy = config.quantization;

        switch (pressure.recommendedAction) {
            case PressureAction::Quantize:
                if (policy.enabled) {
                    QuantizationType type = fallbackType();
                    for (auto& item : entries) {
                        CacheEntry& entry = item.second;
                        if (!entry.quantized && entry.originalSize >= policy.thresholdBytes &&
                            requantize(entry, type)) {
                            ++outcome.quantized;
                        }
                    }
                }
                break;
            case PressureAction::Evict:
                outcome.evicted = evictCount(
                    MemoryPressureMonitor::evictionTarget(entries.size(),
                                                          MemoryPressureMonitor::kPressureEvictionFraction),
                    evicted);
                break;
            case PressureAction::EmergencyCleanup:
                outcome.expired = purgeExpired(now);
                if (policy.enabled) {
                    for (auto& item : entries) {
                        CacheEntry& entry = item.second;
                        if (entry.originalSize >= policy.thresholdBytes &&
                            entry.quantizationType != QuantizationType::Int4 &&
                            requantize(entry, QuantizationType::Int4)) {
                            ++outcome.quantized;
                        }
                    }
                }
                outcome.evicted = evictCount(
                    MemoryPressureMonitor::evictionTarget(entries.size(),
                                                          MemoryPressureMonitor::kPressureEvictionFraction),
                    evicted);
                break;
            case PressureAction::None:
            case PressureAction::Shrink:
                break;
        }

        if (outcome.evicted > 0 || outcome.quantized > 0 || outcome.expired > 0) {
            logger->info("[{}] Memory pressure {} ({:.1f}%): evicted={}, requantized={}, expired={}",
                         name, toString(pressure.level), pressure.usagePercentage * 100.0,
                         outcome.evicted, outcome.quantized, outcome.expired);
        }
        return outcome;
    }

    void applyAdaptiveResize(TimePoint now, MaintenanceReport& report, EvictedList& evicted) {
        const AdaptiveResizePolicy& policy = config.adaptiveResize;
        if (!policy.enabled || hits + misses == 0 || now - lastResize < policy.resizeInterval) {
            return;
        }
        lastResize = now;

        ResizeDecision decision = MemoryPressureMonitor::decideResize(hitRate(), usageRatio(), capacity, policy);
        report.resize = decision.direction;
        if (decision.direction == ResizeDirection::None) {
            return;
        }

        logger->info("[{}] Resizing capacity {} -> {} (hitRate={:.3f}, usage={:.3f})",
                     name, capacity, decision.newCapacity, hitRate(), usageRatio());
        capacity = decision.newCapacity;
        while (entries.size() > capacity && evictLowest(evicted)) {
            ++report.entriesEvicted;
        }
    }

    // Наиболее востребованные ключи, по убыванию числа обращений
    std::vector<KeyUsage> topKeys(size_t limit) const {
        std::vector<KeyUsage> usage;
        usage.reserve(entries.size());
        for (const auto& item : entries) {
            usage.push_back({item.first, item.second.accessCount, item.second.size});
        }
        auto byAccess = [](const KeyUsage& a, const KeyUsage& b) {
            return a.accessCount != b.accessCount ? a.accessCount > b.accessCount : a.key < b.key;
        };
        size_t count = std::min(limit, usage.size());
        std::partial_sort(usage.begin(), usage.begin() + count, usage.end(), byAccess);
        usage.resize(count);
        return usage;
    }

    CacheMetrics snapshot() const {
        CacheMetrics metrics;
        metrics.hits = hits;
        metrics.misses = misses;
        metrics.evictions = evictions;
        metrics.quantizations = quantizations;
        metrics.quantizationErrors = decodeErrors + quantizer.errorCount();
        metrics.trainingFailures = predictor.trainingFailures();
        metrics.totalRequests = totalRequests;
        metrics.memoryUsage = memoryUsage;
        metrics.entryCount = entries.size();
        metrics.capacity = capacity;
        metrics.averageEntrySize = entries.empty() ? 0.0 : static_cast<double>(memoryUsage) / entries.size();
        metrics.hitRate = hitRate();
        metrics.evictionRate = totalRequests > 0 ? static_cast<double>(evictions) / totalRequests : 0.0;
        metrics.compressionRatio = memoryUsage > 0 ? static_cast<double>(originalTotal) / memoryUsage : 1.0;
        metrics.memoryEfficiency = metrics.compressionRatio;
        metrics.averageAccessTimeMs = averageAccessTimeMs;
        metrics.predictedHits = predictedHits;
        metrics.mlAccuracy = predictedHits > 0 ? static_cast<double>(confirmedPredictions) / predictedHits : 0.0;
        return metrics;
    }

    std::vector<CacheAlert> evaluateAlerts(TimePoint now) {
        std::vector<CacheAlert> raised;
        const CacheMetrics metrics = snapshot();
        const AlertThresholds& thresholds = config.monitoring.alertThresholds;

        auto raiseAlert = [&](AlertType type, AlertSeverity severity, std::string message) {
            if (alerts.hasOpen(type)) {
                return;
            }
            CacheAlert alert;
            alert.type = type;
            alert.severity = severity;
            alert.message = std::move(message);
            alert.metrics = metrics;
            alert.timestamp = now;
            logger->warn("[{}] Alert {} ({}): {}", name, toString(type), toString(severity), alert.message);
            alerts.push(alert);
            raised.push_back(std::move(alert));
        };
        auto settleAlert = [&](AlertType type) {
            if (alerts.resolve(type) > 0) {
                logger->info("[{}] Alert {} resolved", name, toString(type));
            }
        };

        if (metrics.hits + metrics.misses > 0 && metrics.hitRate < thresholds.hitRate) {
            raiseAlert(AlertType::LowHitRate, AlertSeverity::Warning,
                  fmt::format("Hit rate {:.1f}% is below {:.1f}%",
                              metrics.hitRate * 100.0, thresholds.hitRate * 100.0));
        } else {
            settleAlert(AlertType::LowHitRate);
        }

        double usage = usageRatio();
        if (usage > thresholds.memoryUsage) {
            MemoryPressureLevel level = MemoryPressureMonitor::classify(usage);
            raiseAlert(AlertType::MemoryPressure,
                  level == MemoryPressureLevel::Critical ? AlertSeverity::Critical : AlertSeverity::Error,
                  fmt::format("Memory usage {:.1f}% exceeds {:.1f}% (level {})",
                              usage * 100.0, thresholds.memoryUsage * 100.0, toString(level)));
        } else {
            settleAlert(AlertType::MemoryPressure);
        }

        if (metrics.evictionRate > thresholds.evictionRate) {
            raiseAlert(AlertType::HighEviction, AlertSeverity::Warning,
                  fmt::format("Eviction rate {:.3f} exceeds {:.3f}",
                              metrics.evictionRate, thresholds.evictionRate));
        } else {
            settleAlert(AlertType::HighEviction);
        }

        if (metrics.quantizationErrors > reportedQuantizationErrors) {
            raiseAlert(AlertType::QuantizationFailure, AlertSeverity::Warning,
                  fmt::format("{} new quantization errors",
                              metrics.quantizationErrors - reportedQuantizationErrors));
        } else {
            settleAlert(AlertType::QuantizationFailure);
        }
        reportedQuantizationErrors = metrics.quantizationErrors;

        if (metrics.trainingFailures > reportedTrainingFailures) {
            raiseAlert(AlertType::PredictionError, AlertSeverity::Warning,
                  fmt::format("{} new hit predictor training failures",
                              metrics.trainingFailures - reportedTrainingFailures));
        } else {
            settleAlert(AlertType::PredictionError);
        }
        reportedTrainingFailures = metrics.trainingFailures;

        return raised;
    }

    // Вызов обработчиков без блокировки хранилища
    void notify(const EvictedList& evicted, const std::vector<CacheAlert>& raised) {
        if (evicted.empty() && raised.empty()) {
            return;
        }
        EvictionCallback evictionHandler;
        AlertCallback alertHandler;
        {
            std::lock_guard<std::mutex> lock(callbackMutex);
            evictionHandler = onEviction;
            alertHandler = onAlert;
        }

        // Ошибка одного обработчика не отменяет остальные вызовы
        if (evictionHandler) {
            for (const auto& item : evicted) {
                try {
                    evictionHandler(item.first, item.second);
                } catch (const std::exception& e) {
                    logger->error("[{}] Eviction callback failed for key={}: {}", name, item.first, e.what());
                }
            }
        }
        if (alertHandler) {
            for (const auto& alert : raised) {
                try {
                    alertHandler(alert);
                } catch (const std::exception& e) {
                    logger->error("[{}] Alert callback failed for {}: {}", name, toString(alert.type), e.what());
                }
            }
        }
    }
};

// Конструктор
CacheManager::CacheManager(const CacheConfiguration& config, std::string name, TimeSource timeSource) {
    std::string error = config.validationError();
    if (!error.empty()) {
        logging::LoggerFactory::get("kvcache")->error("[{}] Invalid cache configuration: {}", name, error);
        throw std::invalid_argument("Invalid cache configuration: " + error);
    }

    pImpl = std::make_unique<Impl>(config, std::move(name), std::move(timeSource));
    pImpl->startTicker(this, config.monitoring);
    pImpl->logger->info("[{}] Cache created: maxSize={}, maxMemoryMB={}, quantization={}, monitoring={}",
                        pImpl->name, config.maxSize, config.maxMemoryMB,
                        config.quantization.enabled ? toString(config.quantization.type) : "off",
                        config.monitoring.enabled);
}

// Деструктор
CacheManager::~CacheManager() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        pImpl->logger->error("[{}] Shutdown failed: {}", pImpl->name, e.what());
    }
}

std::optional<Value> CacheManager::get(const std::string& key) {
    const auto started = std::chrono::steady_clock::now();
    try {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            return std::nullopt;
        }
        ++pImpl->totalRequests;
        const TimePoint now = pImpl->now();

        auto miss = [&]() -> std::optional<Value> {
            ++pImpl->misses;
            pImpl->predictor.recordAccess(key, now, false);
            pImpl->recordAccessTime(started);
            return std::nullopt;
        };

        auto it = pImpl->entries.find(key);
        if (it == pImpl->entries.end()) {
            pImpl->logger->debug("[{}] Cache miss: {}", pImpl->name, key);
            return miss();
        }
        if (it->second.isExpired(now)) {
            pImpl->logger->debug("[{}] Entry expired: {}", pImpl->name, key);
            pImpl->unaccount(it->second);
            pImpl->entries.erase(it);
            return miss();
        }

        CacheEntry& entry = it->second;
        Value result;
        try {
            result = pImpl->materialize(entry);
        } catch (const QuantizationError& e) {
            ++pImpl->decodeErrors;
            pImpl->logger->error("[{}] Dropping corrupted entry key={}: {}", pImpl->name, key, e.what());
            pImpl->unaccount(entry);
            pImpl->entries.erase(it);
            return miss();
        }

        ++entry.accessCount;
        entry.lastAccessedAt = now;
        entry.priority = computePriority(entry, now);
        if (entry.predictedHit && entry.accessCount == 2) {
            ++pImpl->confirmedPredictions;
        }
        ++pImpl->hits;
        pImpl->predictor.recordAccess(key, now, true);
        pImpl->recordAccessTime(started);
        return result;
    } catch (const std::exception& e) {
        pImpl->logger->error("[{}] Cache get failed for key={}: {}", pImpl->name, key, e.what());
        return std::nullopt;
    }
}

bool CacheManager::set(const std::string& key, const Value& value) {
    std::chrono::milliseconds ttl;
    {
        std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
        ttl = pImpl->config.defaultTTL;
    }
    return set(key, value, ttl);
}

bool CacheManager::set(const std::string& key, const Value& value, std::chrono::milliseconds ttl) {
    const auto started = std::chrono::steady_clock::now();
    EvictedList evicted;
    bool stored = false;
    try {
        const size_t originalSize = value.estimatedSize();

        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            pImpl->logger->warn("[{}] Rejecting set after shutdown: {}", pImpl->name, key);
            return false;
        }
        ++pImpl->totalRequests;
        const TimePoint now = pImpl->now();
        const size_t maxBytes = pImpl->config.maxMemoryBytes();

        const MemoryPressure pressure = MemoryPressureMonitor::evaluate(pImpl->memoryUsage, maxBytes);
        pImpl->respondToPressure(pressure, now, evicted);

        auto existing = pImpl->entries.find(key);
        if (existing != pImpl->entries.end()) {
            pImpl->unaccount(existing->second);
            pImpl->entries.erase(existing);
        }

        CacheEntry entry;
        entry.key = key;
        entry.originalSize = originalSize;
        entry.createdAt = now;
        entry.lastAccessedAt = now;
        entry.ttl = ttl;

        if (pImpl->shouldQuantize(originalSize, pressure.level)) {
            QuantizedValue encoded = pImpl->quantizer.quantize(value, pImpl->config.quantization.type);
            if (encoded.quantized()) {
                entry.encoded = std::move(encoded.bytes);
                entry.metadata = std::move(encoded.metadata);
                entry.quantized = true;
                entry.quantizationType = entry.metadata.type;
                entry.size = entry.metadata.encodedSize;
                ++pImpl->quantizations;
            }
        }
        if (!entry.quantized) {
            entry.value = value;
            entry.size = originalSize;
        }

        const double headroom = maxBytes * MemoryPressureMonitor::kInsertHeadroom;
        while ((pImpl->entries.size() >= pImpl->capacity ||
                static_cast<double>(pImpl->memoryUsage) >= headroom) &&
               pImpl->evictLowest(evicted)) {
        }

        const double probability = pImpl->predictor.predict(key, now);
        entry.priority = probability * 100.0;
        if (pImpl->config.mlPrediction.enabled &&
            probability >= pImpl->config.mlPrediction.confidenceThreshold) {
            entry.predictedHit = true;
            ++pImpl->predictedHits;
        }

        pImpl->logger->debug("[{}] Stored key={}, size={}, originalSize={}, quantization={}",
                             pImpl->name, key, entry.size, entry.originalSize,
                             toString(entry.quantizationType));
        pImpl->account(entry);
        pImpl->entries.emplace(key, std::move(entry));
        pImpl->recordAccessTime(started);
        stored = true;
    } catch (const std::exception& e) {
        pImpl->logger->error("[{}] Cache set failed for key={}: {}", pImpl->name, key, e.what());
    }
    pImpl->notify(evicted, {});
    return stored;
}

bool CacheManager::has(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(key);
    return it != pImpl->entries.end() && !it->second.isExpired(pImpl->now());
}

bool CacheManager::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(key);
    if (it == pImpl->entries.end()) {
        return false;
    }
    pImpl->unaccount(it->second);
    pImpl->entries.erase(it);
    pImpl->predictor.forget(key);
    return true;
}

void CacheManager::clear() {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    for (const auto& item : pImpl->entries) {
        pImpl->predictor.forget(item.first);
    }
    pImpl->entries.clear();
    pImpl->memoryUsage = 0;
    pImpl->originalTotal = 0;
    pImpl->logger->info("[{}] Cache cleared", pImpl->name);
}

size_t CacheManager::size() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->entries.size();
}

size_t CacheManager::capacity() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->capacity;
}

std::optional<EntryInfo> CacheManager::getEntryInfo(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(key);
    if (it == pImpl->entries.end()) {
        return std::nullopt;
    }
    const CacheEntry& entry = it->second;
    EntryInfo info;
    info.key = entry.key;
    info.quantized = entry.quantized;
    info.quantizationType = entry.quantizationType;
    info.size = entry.size;
    info.originalSize = entry.originalSize;
    info.accessCount = entry.accessCount;
    info.priority = entry.priority;
    info.ttl = entry.ttl;
    info.createdAt = entry.createdAt;
    info.lastAccessedAt = entry.lastAccessedAt;
    return info;
}

std::vector<KeyUsage> CacheManager::getTopKeys(size_t limit) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->topKeys(limit);
}

double CacheManager::predictHit(const std::string& key) const {
    return pImpl->predictor.predict(key, pImpl->now());
}

CacheMetrics CacheManager::getMetrics() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->snapshot();
}

MemoryPressure CacheManager::getMemoryPressure() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return MemoryPressureMonitor::evaluate(pImpl->memoryUsage, pImpl->config.maxMemoryBytes());
}

std::vector<CacheAlert> CacheManager::getAlerts() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->alerts.unresolved();
}

std::vector<CacheAlert> CacheManager::getAlertHistory() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->alerts.all();
}

CacheConfiguration CacheManager::getConfiguration() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->config;
}

void CacheManager::updateConfiguration(const CacheConfiguration& config) {
    std::string error = config.validationError();
    if (!error.empty()) {
        pImpl->logger->error("[{}] Rejected configuration update: {}", pImpl->name, error);
        throw std::invalid_argument("Invalid cache configuration: " + error);
    }

    EvictedList evicted;
    bool restartTicker = false;
    {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        const MonitoringPolicy& previous = pImpl->config.monitoring;
        restartTicker = previous.enabled != config.monitoring.enabled ||
                        previous.metricsInterval != config.monitoring.metricsInterval;

        pImpl->predictor.setConfiguration(toPredictorConfig(config.mlPrediction));
        pImpl->config = config;
        pImpl->capacity = config.maxSize;
        while (pImpl->entries.size() > pImpl->capacity && pImpl->evictLowest(evicted)) {
        }
        pImpl->logger->info("[{}] Configuration updated: maxSize={}, maxMemoryMB={}",
                            pImpl->name, config.maxSize, config.maxMemoryMB);
    }

    if (restartTicker) {
        pImpl->startTicker(this, config.monitoring);
    }
    pImpl->notify(evicted, {});
}

OptimizationResult CacheManager::optimizeMemory() {
    OptimizationResult result;
    EvictedList evicted;
    {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        if (pImpl->stopped) {
            return result;
        }
        const size_t before = pImpl->memoryUsage;
        const size_t threshold = pImpl->config.quantization.thresholdBytes;
        const QuantizationType type = pImpl->fallbackType();

        for (auto& item : pImpl->entries) {
            CacheEntry& entry = item.second;
            if (!entry.quantized && entry.originalSize >= threshold && pImpl->requantize(entry, type)) {
                ++result.quantizationsApplied;
            }
        }
        result.entriesEvicted = pImpl->evictCount(
            MemoryPressureMonitor::evictionTarget(pImpl->entries.size(),
                                                  MemoryPressureMonitor::kOptimizeEvictionFraction),
            evicted);
        result.memoryFreed = static_cast<int64_t>(before) - static_cast<int64_t>(pImpl->memoryUsage);

        pImpl->logger->info("[{}] Memory optimized: evicted={}, quantized={}, freed={} bytes",
                            pImpl->name, result.entriesEvicted, result.quantizationsApplied, result.memoryFreed);
    }
    pImpl->notify(evicted, {});
    return result;
}

MaintenanceReport CacheManager::runMaintenance() {
    MaintenanceReport report;
    if (pImpl->stopped) {
        return report;
    }

    EvictedList evicted;
    std::vector<CacheAlert> raised;
    try {
        std::vector<std::string> keys;
        {
            std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
            keys.reserve(pImpl->entries.size());
            for (const auto& item : pImpl->entries) {
                keys.push_back(item.first);
            }
        }
        for (size_t offset = 0; offset < keys.size(); offset += kExpirySweepChunk) {
            std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
            const TimePoint now = pImpl->now();
            const size_t last = std::min(keys.size(), offset + kExpirySweepChunk);
            for (size_t i = offset; i < last; ++i) {
                auto it = pImpl->entries.find(keys[i]);
                if (it != pImpl->entries.end() && it->second.isExpired(now)) {
                    pImpl->unaccount(it->second);
                    pImpl->predictor.forget(it->first);
                    pImpl->entries.erase(it);
                    ++report.expiredRemoved;
                }
            }
        }

        bool trainPredictor = false;
        {
            std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
            const TimePoint now = pImpl->now();
            const MemoryPressure pressure =
                MemoryPressureMonitor::evaluate(pImpl->memoryUsage, pImpl->config.maxMemoryBytes());
            report.pressureLevel = pressure.level;
            Impl::PressureOutcome outcome = pImpl->respondToPressure(pressure, now, evicted);
            report.entriesEvicted += outcome.evicted;
            report.quantizationsApplied += outcome.quantized;
            report.expiredRemoved += outcome.expired;

            report.capacityBefore = pImpl->capacity;
            pImpl->applyAdaptiveResize(now, report, evicted);
            report.capacityAfter = pImpl->capacity;
            trainPredictor = pImpl->config.mlPrediction.enabled;
        }

        // Обучение идёт вне блокировки хранилища
        report.predictorKeysPruned = pImpl->predictor.prune(pImpl->now());
        if (trainPredictor) {
            report.predictorTrained = pImpl->predictor.train();
        }

        {
            std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
            raised = pImpl->evaluateAlerts(pImpl->now());
            report.alertsRaised = raised.size();
        }

        if (report.expiredRemoved > 0 || report.entriesEvicted > 0) {
            pImpl->logger->debug("[{}] Maintenance: expired={}, evicted={}, capacity={}",
                                 pImpl->name, report.expiredRemoved, report.entriesEvicted,
                                 report.capacityAfter);
        }
    } catch (const std::exception& e) {
        pImpl->logger->error("[{}] Maintenance failed: {}", pImpl->name, e.what());
    }

    pImpl->notify(evicted, raised);
    return report;
}

nlohmann::json CacheManager::statistics() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    const CacheMetrics metrics = pImpl->snapshot();

    nlohmann::json topKeys = nlohmann::json::array();
    for (const auto& usage : pImpl->topKeys(kExportTopKeys)) {
        topKeys.push_back(usage.toJson());
    }

    nlohmann::json alerts = nlohmann::json::array();
    for (const auto& alert : pImpl->alerts.all()) {
        alerts.push_back(alert.toJson());
    }

    return {
        {"timestamp", formatTimestamp(pImpl->now())},
        {"name", pImpl->name},
        {"configuration", pImpl->config.toJson()},
        {"metrics", metrics.toJson()},
        {"memoryPressure",
         MemoryPressureMonitor::evaluate(pImpl->memoryUsage, pImpl->config.maxMemoryBytes()).toJson()},
        {"cacheSize", pImpl->entries.size()},
        {"capacity", pImpl->capacity},
        {"topKeys", topKeys},
        {"alerts", alerts},
        {"predictor", {
            {"trained", pImpl->predictor.isTrained()},
            {"samples", pImpl->predictor.sampleCount()},
            {"trackedKeys", pImpl->predictor.trackedKeys()},
            {"trainingRuns", pImpl->predictor.trainingRuns()}
        }},
        {"performance", {
            {"averageAccessTimeMs", metrics.averageAccessTimeMs},
            {"hitRate", metrics.hitRate},
            {"memoryEfficiency", metrics.memoryEfficiency},
            {"compressionRatio", metrics.compressionRatio}
        }}
    };
}

std::string CacheManager::exportStatistics() const {
    return statistics().dump(2);
}

void CacheManager::setEvictionCallback(EvictionCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
    pImpl->onEviction = std::move(callback);
}

void CacheManager::setAlertCallback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl->callbackMutex);
    pImpl->onAlert = std::move(callback);
}

const std::string& CacheManager::name() const {
    return pImpl->name;
}

bool CacheManager::isRunning() const {
    return !pImpl->stopped;
}

void CacheManager::shutdown() {
    if (pImpl->stopped.exchange(true)) {
        return;
    }
    pImpl->maintenance.stop();
    {
        std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
        pImpl->entries.clear();
        pImpl->memoryUsage = 0;
        pImpl->originalTotal = 0;
        pImpl->alerts.clear();
    }
    pImpl->predictor.clear();
    pImpl->logger->info("[{}] Cache shut down", pImpl->name);
}

} // namespace cache
} // namespace core
} // namespace morph
