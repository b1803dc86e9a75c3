// ========================= src/core/Log.hpp =========================
#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace pour {

    // Shared colored stdout logger named "pour", created on first use.
    std::shared_ptr<spdlog::logger> log();

    // "trace".."off"; throws std::invalid_argument for anything else
    void setLogLevel(const std::string& level);

} // namespace pour
