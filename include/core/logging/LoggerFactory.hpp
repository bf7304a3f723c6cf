#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace morph {
namespace core {
namespace logging {

// Параметры именованных логгеров
struct LoggerOptions {
    std::string directory = "logs";
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 3;
    spdlog::level::level_enum level = spdlog::level::debug;
};

/**
 * @brief Фабрика именованных логгеров.
 * @details Возвращает уже зарегистрированный логгер, иначе создаёт
 * rotating-логгер <directory>/<name>.log. Если файл создать не удалось,
 * используется цветной консольный логгер. Никогда не возвращает nullptr.
 */
class LoggerFactory {
public:
    static std::shared_ptr<spdlog::logger> get(const std::string& name);
    static std::shared_ptr<spdlog::logger> get(const std::string& name, const LoggerOptions& options);

    // Опции по умолчанию для логгеров, создаваемых через get(name)
    static void setDefaultOptions(const LoggerOptions& options);
    static LoggerOptions defaultOptions();
};

} // namespace logging
} // namespace core
} // namespace morph
