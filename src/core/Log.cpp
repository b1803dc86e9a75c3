// ========================= src/core/Log.cpp =========================
#include "Log.hpp"
#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pour {

    std::shared_ptr<spdlog::logger> log() {
        static std::once_flag once;
        static std::shared_ptr<spdlog::logger> logger;
        std::call_once(once, [] {
            logger = spdlog::get("pour");
            if (!logger) logger = spdlog::stdout_color_mt("pour");
            logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
            logger->set_level(spdlog::level::info);
        });
        return logger;
    }

    void setLogLevel(const std::string& level) {
        auto lvl = spdlog::level::from_str(level);
        // from_str maps unknown names to off; only accept "off" when asked for
        if (lvl == spdlog::level::off && level != "off") {
            throw std::invalid_argument("unknown log level '" + level + "'");
        }
        log()->set_level(lvl);
    }

} // namespace pour
