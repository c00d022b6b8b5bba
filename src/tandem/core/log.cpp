// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tandem/core/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace tandem::core {

void init_logging(std::string_view level) noexcept {
    try {
        auto logger = spdlog::stderr_color_mt("tandem");
        logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // Already registered by an earlier call
    }

    auto lvl = spdlog::level::from_str(std::string(level));
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    spdlog::set_level(lvl);
}

} // namespace tandem::core
