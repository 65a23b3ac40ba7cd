#include "smcp/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace smcp {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        const std::string name(LOGGER_NAME);
        if (auto existing = spdlog::get(name)) return existing;
        auto created = spdlog::stderr_color_mt(name);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace smcp
