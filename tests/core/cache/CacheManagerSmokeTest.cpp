#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/manager/CacheManager.hpp"

using namespace morph::core::cache;
using namespace std::chrono_literals;

namespace {

// Управляемые часы для детерминированных приоритетов и TTL
struct ManualClock {
    TimePoint now{std::chrono::hours(24 * 365 * 50)};

    CacheManager::TimeSource source() {
        return [this] { return now; };
    }
};

CacheConfiguration testConfig() {
    CacheConfiguration config;
    config.maxSize = 100;
    config.maxMemoryMB = 16;
    config.adaptiveResize.enabled = false;
    config.monitoring.enabled = false;
    return config;
}

} // namespace

void smokeTestBasicOperations() {
    ManualClock clock;
    CacheManager cache(testConfig(), "basic", clock.source());

    assert(cache.set("a", Value("alpha")));
    assert(cache.has("a"));
    auto v = cache.get("a");
    assert(v && *v == Value("alpha"));
    assert(!cache.get("missing"));

    assert(cache.remove("a"));
    assert(!cache.remove("a"));
    assert(!cache.has("a"));

    cache.set("x", 1);
    cache.set("y", 2);
    cache.set("x", 3);
    assert(cache.size() == 2);
    assert(cache.get("x")->asNumber() == 3);
    assert(cache.getMetrics().evictions == 0);

    cache.clear();
    assert(cache.size() == 0);
    assert(!cache.has("x"));
    auto metrics = cache.getMetrics();
    assert(metrics.hits == 2);
    assert(metrics.misses == 1);
    assert(metrics.memoryUsage == 0);
    assert(metrics.entryCount == 0);
    std::cout << "[OK] CacheManager basic operations test\n";
}

void smokeTestEviction() {
    ManualClock clock;
    auto config = testConfig();
    config.maxSize = 3;
    CacheManager cache(config, "eviction", clock.source());

    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const std::string& key, double priority) {
        evicted.push_back(key);
        assert(priority == 50.0);
    });

    for (const char* key : {"a", "b", "c", "d"}) {
        cache.set(key, Value(std::string(key)));
        assert(cache.size() <= cache.capacity());
        clock.now += 1s;
    }
    assert(cache.size() == 3);
    assert(cache.has("d"));
    assert(!cache.has("a"));
    assert(evicted.size() == 1 && evicted[0] == "a");

    // Прочитанная запись получает более высокий приоритет
    assert(cache.get("b"));
    assert(cache.getEntryInfo("b")->priority > 100.0);
    clock.now += 1s;
    cache.set("e", Value("e"));
    assert(cache.has("b"));
    assert(!cache.has("c"));
    assert(cache.has("d") && cache.has("e"));
    assert(cache.getMetrics().evictions == 2);
    std::cout << "[OK] CacheManager eviction test\n";
}

void smokeTestThrowingCallbacks() {
    ManualClock clock;
    auto config = testConfig();
    config.monitoring.alertThresholds.memoryUsage = 0.0;
    CacheManager cache(config, "throwing", clock.source());

    std::vector<std::string> evicted;
    cache.setEvictionCallback([&evicted](const std::string& key, double) {
        evicted.push_back(key);
        throw std::runtime_error("eviction handler failure");
    });
    size_t alertsDelivered = 0;
    cache.setAlertCallback([&alertsDelivered](const CacheAlert&) {
        ++alertsDelivered;
        throw std::runtime_error("alert handler failure");
    });

    for (int i = 0; i < 5; ++i) {
        cache.set("k" + std::to_string(i), i);
        clock.now += 1ms;
    }
    auto smaller = config;
    smaller.maxSize = 2;
    cache.updateConfiguration(smaller);
    // Каждый вытесненный ключ доходит до обработчика
    assert(evicted.size() == 3);
    assert(cache.size() == 2);

    assert(!cache.get("missing"));
    auto report = cache.runMaintenance();
    assert(report.alertsRaised >= 2);
    assert(alertsDelivered == report.alertsRaised);
    std::cout << "[OK] CacheManager throwing callbacks test\n";
}

void smokeTestQuantizationOnSet() {
    ManualClock clock;
    auto config = testConfig();
    config.quantization.thresholdBytes = 100;
    config.quantization.type = QuantizationType::Int8;
    CacheManager cache(config, "quantization", clock.source());

    Value text(std::string(500, 'q'));
    cache.set("long", text);
    auto info = cache.getEntryInfo("long");
    assert(info && info->quantized);
    assert(info->quantizationType == QuantizationType::Int8);
    assert(info->originalSize == 1000);
    assert(info->size < info->originalSize);
    assert(*cache.get("long") == text);

    cache.set("short", Value("tiny"));
    assert(!cache.getEntryInfo("short")->quantized);
    assert(cache.getMetrics().quantizations == 1);
    assert(cache.getMetrics().compressionRatio > 1.0);

    auto fp8 = testConfig();
    fp8.quantization.type = QuantizationType::Fp8;
    fp8.quantization.thresholdBytes = 4;
    fp8.quantization.aggressive = true;
    CacheManager rounded(fp8, "fp8", clock.source());
    rounded.set("pi", 3.14159);
    assert(rounded.getEntryInfo("pi")->quantizationType == QuantizationType::Fp8);
    assert(std::fabs(rounded.get("pi")->asNumber() - 3.14) < 1e-9);

    auto disabled = testConfig();
    disabled.quantization.enabled = false;
    disabled.quantization.thresholdBytes = 100;
    CacheManager raw(disabled, "raw", clock.source());
    raw.set("long", text);
    assert(!raw.getEntryInfo("long")->quantized);
    assert(raw.getEntryInfo("long")->size == 1000);
    std::cout << "[OK] CacheManager quantization on set test\n";
}

void smokeTestTtlAndMaintenance() {
    ManualClock clock;
    CacheManager cache(testConfig(), "ttl", clock.source());

    cache.set("short", Value("s"), 100ms);
    cache.set("long", Value("l"));
    clock.now += 50ms;
    assert(cache.has("short"));
    clock.now += 100ms;
    assert(!cache.has("short"));
    assert(cache.size() == 2);
    assert(!cache.get("short"));
    assert(cache.size() == 1);
    assert(cache.getMetrics().misses == 1);

    cache.set("sweep", Value("w"), 100ms);
    clock.now += 200ms;
    auto report = cache.runMaintenance();
    assert(report.expiredRemoved == 1);
    assert(cache.size() == 1);
    assert(cache.has("long"));
    std::cout << "[OK] CacheManager TTL and maintenance test\n";
}

void smokeTestMetrics() {
    ManualClock clock;
    CacheManager cache(testConfig(), "metrics", clock.source());
    cache.set("k", Value::Array{1, 2, 3});
    for (int i = 0; i < 5; ++i) {
        assert(cache.get("k"));
    }
    auto metrics = cache.getMetrics();
    assert(metrics.hits == 5);
    assert(metrics.misses == 0);
    assert(metrics.hitRate == 1.0);
    assert(metrics.totalRequests == 6);
    assert(metrics.memoryUsage == 24);
    assert(metrics.compressionRatio == 1.0);
    assert(metrics.averageAccessTimeMs >= 0.0);
    assert(metrics.predictedHits == 0);

    auto confident = testConfig();
    confident.mlPrediction.confidenceThreshold = 0.0;
    CacheManager predicted(confident, "predicted", clock.source());
    predicted.set("p", Value("v"));
    predicted.set("q", Value("v"));
    assert(predicted.get("p"));
    assert(predicted.get("p"));
    auto pm = predicted.getMetrics();
    assert(pm.predictedHits == 2);
    assert(pm.mlAccuracy == 0.5);
    assert(predicted.predictHit("p") == 0.5);
    std::cout << "[OK] CacheManager metrics test\n";
}

void smokeTestPredictorHistoryBounded() {
    ManualClock clock;
    auto config = testConfig();
    config.maxSize = 2;
    config.mlPrediction.predictionWindow = 1h;
    CacheManager cache(config, "history", clock.source());
    auto tracked = [&cache] { return cache.statistics()["predictor"]["trackedKeys"].get<size_t>(); };

    for (int i = 0; i < 100; ++i) {
        assert(!cache.get("fingerprint-" + std::to_string(i)));
    }
    assert(tracked() == 100);

    // История вытесненного ключа удаляется
    assert(!cache.get("a"));
    cache.set("a", Value("1"));
    clock.now += 1s;
    cache.set("b", Value("2"));
    clock.now += 1s;
    cache.set("c", Value("3"));
    assert(!cache.has("a"));
    assert(tracked() == 100);

    assert(cache.get("b"));
    assert(tracked() == 101);

    // Истёкшие записи и ключи без обращений за окно забываются
    clock.now += 2h;
    auto report = cache.runMaintenance();
    assert(report.expiredRemoved == 2);
    assert(report.predictorKeysPruned == 100);
    assert(tracked() == 0);
    std::cout << "[OK] CacheManager predictor history bounded test\n";
}

void smokeTestTopKeysAndExport() {
    ManualClock clock;
    CacheManager cache(testConfig(), "export", clock.source());
    cache.set("a", Value("1"));
    cache.set("b", Value("2"));
    cache.set("c", Value("3"));
    for (int i = 0; i < 3; ++i) {
        cache.get("b");
    }
    cache.get("c");

    auto top = cache.getTopKeys(2);
    assert(top.size() == 2);
    assert(top[0].key == "b" && top[0].accessCount == 4);
    assert(top[1].key == "c" && top[1].accessCount == 2);
    assert(cache.getTopKeys(10).size() == 3);
    assert(!cache.getEntryInfo("none"));
    assert(cache.getEntryInfo("a")->ttl == std::chrono::milliseconds(3600000));

    auto stats = nlohmann::json::parse(cache.exportStatistics());
    assert(stats["name"] == "export");
    assert(stats["cacheSize"] == 3);
    assert(stats["capacity"] == 100);
    assert(stats["topKeys"].size() == 3);
    assert(stats["topKeys"][0]["key"] == "b");
    assert(stats["metrics"]["hits"] == 4);
    assert(stats["memoryPressure"]["level"] == "low");
    assert(stats["configuration"]["maxSize"] == 100);
    assert(stats["performance"]["hitRate"] == 1.0);
    assert(stats["alerts"].is_array());
    std::string timestamp = stats["timestamp"].get<std::string>();
    assert(timestamp.size() == 24 && timestamp.back() == 'Z');

    // Экспорт не меняет состояние
    assert(cache.getMetrics().totalRequests == 7);
    std::cout << "[OK] CacheManager top keys and export test\n";
}

void smokeTestConfigurationUpdate() {
    ManualClock clock;
    CacheManager cache(testConfig(), "config", clock.source());
    for (int i = 0; i < 10; ++i) {
        cache.set("k" + std::to_string(i), i);
        clock.now += 1ms;
    }

    auto invalid = testConfig();
    invalid.maxMemoryMB = 0;
    bool threw = false;
    try {
        cache.updateConfiguration(invalid);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(cache.getConfiguration().maxMemoryMB == 16);

    auto nanGrowth = testConfig();
    nanGrowth.adaptiveResize.growthFactor = std::nan("");
    threw = false;
    try {
        cache.updateConfiguration(nanGrowth);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(cache.getConfiguration().adaptiveResize.growthFactor == 1.3);
    assert(cache.size() == 10);

    auto smaller = testConfig();
    smaller.maxSize = 5;
    cache.updateConfiguration(smaller);
    assert(cache.capacity() == 5);
    assert(cache.size() == 5);
    assert(!cache.has("k0"));
    assert(cache.has("k9"));

    threw = false;
    try {
        CacheManager rejected(invalid, "rejected");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] CacheManager configuration update test\n";
}

void smokeTestShutdown() {
    auto config = testConfig();
    config.monitoring.enabled = true;
    config.monitoring.metricsInterval = 10ms;
    CacheManager cache(config, "shutdown");
    cache.set("k", Value("v"));
    std::this_thread::sleep_for(30ms);
    assert(cache.isRunning());

    cache.shutdown();
    cache.shutdown();
    assert(!cache.isRunning());
    assert(cache.size() == 0);
    assert(!cache.set("k", Value("v")));
    assert(!cache.get("k"));
    std::cout << "[OK] CacheManager shutdown test\n";
}

void smokeTestReconfigureFromAlertCallback() {
    auto config = testConfig();
    config.monitoring.enabled = true;
    config.monitoring.metricsInterval = 5ms;
    CacheManager cache(config, "reconfigure");

    auto faster = config;
    faster.monitoring.metricsInterval = 3ms;
    std::atomic<int> delivered{0};
    // Обработчик вызывается на потоке обслуживания
    cache.setAlertCallback([&cache, &delivered, faster](const CacheAlert&) {
        if (++delivered == 1) {
            cache.updateConfiguration(faster);
        }
    });

    assert(!cache.get("missing"));
    for (int i = 0; i < 400 && cache.getConfiguration().monitoring.metricsInterval != 3ms; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    assert(delivered.load() >= 1);
    assert(cache.getConfiguration().monitoring.metricsInterval == 3ms);

    // Обслуживание продолжается с новым интервалом
    cache.set("short", Value("s"), 1ms);
    for (int i = 0; i < 400 && cache.size() > 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    assert(cache.size() == 0);

    cache.shutdown();
    assert(!cache.isRunning());
    std::cout << "[OK] CacheManager reconfigure from alert callback test\n";
}

void stressTestConcurrentAccess() {
    auto config = testConfig();
    config.maxSize = 64;
    config.monitoring.enabled = true;
    config.monitoring.metricsInterval = 5ms;
    CacheManager cache(config, "stress");

    const int threads = 4;
    const int operations = 2000;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&cache, t] {
            for (int i = 0; i < operations; ++i) {
                std::string key = "key-" + std::to_string((i * 7 + t) % 200);
                cache.set(key, Value::Object{{"thread", t}, {"iteration", i}});
                cache.get(key);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    assert(cache.size() <= cache.capacity());
    assert(cache.getMetrics().totalRequests == static_cast<size_t>(threads * operations * 2));
    cache.shutdown();
    std::cout << "[OK] CacheManager concurrent stress test\n";
}

int main() {
    smokeTestBasicOperations();
    smokeTestEviction();
    smokeTestThrowingCallbacks();
    smokeTestQuantizationOnSet();
    smokeTestTtlAndMaintenance();
    smokeTestMetrics();
    smokeTestPredictorHistoryBounded();
    smokeTestTopKeysAndExport();
    smokeTestConfigurationUpdate();
    smokeTestShutdown();
    smokeTestReconfigureFromAlertCallback();
    stressTestConcurrentAccess();
    std::cout << "All CacheManager tests passed!\n";
    return 0;
}
