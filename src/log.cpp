#include "ark/log.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ark {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("ark");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("ark");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        return created;
    }();
    return instance;
}

void setLogLevel(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace ark
