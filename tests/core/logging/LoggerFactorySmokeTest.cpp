#include <cassert>
#include <iostream>
#include <spdlog/spdlog.h>
#include "core/logging/LoggerFactory.hpp"

using namespace morph::core::logging;

void smokeTestLoggerFactory() {
    auto first = LoggerFactory::get("factory_smoke");
    auto second = LoggerFactory::get("factory_smoke");
    assert(first);
    assert(first == second);
    assert(first->name() == "factory_smoke");
    assert(spdlog::get("factory_smoke") == first);

    LoggerOptions options;
    options.level = spdlog::level::warn;
    LoggerFactory::setDefaultOptions(options);
    assert(LoggerFactory::defaultOptions().level == spdlog::level::warn);
    auto quiet = LoggerFactory::get("factory_quiet");
    assert(quiet->level() == spdlog::level::warn);

    // Недоступный каталог: консольный логгер вместо файлового
    LoggerOptions broken;
    broken.directory = "/proc/morphkv-no-such-dir";
    auto fallback = LoggerFactory::get("factory_fallback", broken);
    assert(fallback);
    fallback->info("fallback logger works");
    std::cout << "[OK] LoggerFactory smoke test\n";
}

int main() {
    smokeTestLoggerFactory();
    std::cout << "All LoggerFactory tests passed!\n";
    return 0;
}
