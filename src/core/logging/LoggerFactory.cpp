#include "core/logging/LoggerFactory.hpp"
#include <iostream>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace morph {
namespace core {
namespace logging {

namespace {

std::mutex& factoryMutex() {
    static std::mutex mutex;
    return mutex;
}

LoggerOptions& sharedOptions() {
    static LoggerOptions options;
    return options;
}

} // namespace

std::shared_ptr<spdlog::logger> LoggerFactory::get(const std::string& name) {
    return get(name, defaultOptions());
}

std::shared_ptr<spdlog::logger> LoggerFactory::get(const std::string& name, const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(factoryMutex());
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    try {
        logger = spdlog::rotating_logger_mt(name, options.directory + "/" + name + ".log",
                                            options.maxFileSize, options.maxFiles);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
        logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::stdout_color_mt(name);
        }
    }
    logger->set_level(options.level);
    return logger;
}

void LoggerFactory::setDefaultOptions(const LoggerOptions& options) {
    std::lock_guard<std::mutex> lock(factoryMutex());
    sharedOptions() = options;
}

LoggerOptions LoggerFactory::defaultOptions() {
    std::lock_guard<std::mutex> lock(factoryMutex());
    return sharedOptions();
}

} // namespace logging
} // namespace core
} // namespace morph
