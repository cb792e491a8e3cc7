#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace ark {

/// The library logger ("ark"), writing to stderr. Created on first use.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(spdlog::level::level_enum level);

} // namespace ark
