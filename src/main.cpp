#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/cache/manager/CacheManager.hpp"
#include "core/cache/metrics/CacheConfig.hpp"
#include "core/logging/LoggerFactory.hpp"

using namespace morph::core;

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    g_running = false;
    (void)signal;
}

// Initialize logging system
void initializeLogging() {
    try {
        std::filesystem::create_directories("logs");

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "logs/morphkv.log", 1024 * 1024 * 10, 5);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("morphkv",
            spdlog::sinks_init_list{console_sink, file_sink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::debug);

        // Логгеры кэша пишут в тот же каталог
        logging::LoggerOptions options;
        options.level = spdlog::level::info;
        logging::LoggerFactory::setDefaultOptions(options);
        spdlog::info("=== morphkv demo starting ===");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

cache::CacheConfiguration loadConfiguration(int argc, char* argv[]) {
    if (argc > 1) {
        spdlog::info("Loading cache configuration from {}", argv[1]);
        return cache::CacheConfiguration::loadFromFile(argv[1]);
    }
    cache::CacheConfiguration config;
    config.maxSize = 256;
    config.maxMemoryMB = 4;
    config.quantization.thresholdBytes = 512;
    config.adaptiveResize.minSize = 64;
    config.adaptiveResize.maxSize = 1024;
    config.adaptiveResize.resizeInterval = std::chrono::milliseconds(0);
    config.monitoring.metricsInterval = std::chrono::milliseconds(500);
    return config;
}

// Результат анализа файла, как его кладёт конвейер
cache::Value makeAnalysis(int fileIndex) {
    cache::Value::Array issues;
    for (int i = 0; i < fileIndex % 5; ++i) {
        issues.push_back(cache::Value::Object{
            {"line", 10 * i + fileIndex},
            {"severity", i % 2 == 0 ? "warning" : "error"},
            {"message", "Unused variable in function body, consider removing it " + std::to_string(i)}
        });
    }
    return cache::Value::Object{
        {"file", "src/module_" + std::to_string(fileIndex) + ".cpp"},
        {"complexity", 3.75 + fileIndex * 0.5},
        {"lines", 120 + fileIndex},
        {"issues", issues},
        {"summary", std::string(200 + 40 * (fileIndex % 7), static_cast<char>('a' + fileIndex % 26))}
    };
}

void runWorkload(cache::CacheManager& analysis, cache::CacheManager& suggestions) {
    const int files = 400;
    for (int round = 0; round < 3 && g_running; ++round) {
        for (int i = 0; i < files && g_running; ++i) {
            std::string key = "sha1:" + std::to_string(i);
            if (!analysis.get(key)) {
                analysis.set(key, makeAnalysis(i));
            }
            if (i % 3 == 0 && !suggestions.get(key)) {
                suggestions.set(key, cache::Value::Array{"extract method", "rename variable", 0.82},
                                std::chrono::minutes(5));
            }
        }
        auto report = analysis.runMaintenance();
        spdlog::info("Round {}: size={}, capacity={}, evicted={}, alerts={}",
                     round, analysis.size(), analysis.capacity(), report.entriesEvicted, report.alertsRaised);
    }

    auto optimized = analysis.optimizeMemory();
    spdlog::info("optimizeMemory: {}", optimized.toJson().dump());
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        initializeLogging();
        cache::CacheConfiguration config = loadConfiguration(argc, argv);

        cache::CacheManager analysis(config, "analysis");
        cache::CacheManager suggestions(config, "suggestions");

        analysis.setEvictionCallback([](const std::string& key, double priority) {
            spdlog::debug("analysis evicted {} (priority {:.2f})", key, priority);
        });
        analysis.setAlertCallback([](const cache::CacheAlert& alert) {
            spdlog::warn("analysis alert [{}] {}", cache::toString(alert.type), alert.message);
        });

        runWorkload(analysis, suggestions);

        std::cout << analysis.exportStatistics() << std::endl;
        std::cout << suggestions.exportStatistics() << std::endl;

        analysis.shutdown();
        suggestions.shutdown();
        spdlog::info("=== morphkv demo finished ===");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
    return 0;
}
