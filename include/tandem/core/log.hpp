// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace tandem::core {

// Route the default spdlog logger to stderr and apply a level name
// ("trace", "debug", "info", "warn", "error", "off"). Unknown names keep info.
void init_logging(std::string_view level) noexcept;

} // namespace tandem::core
