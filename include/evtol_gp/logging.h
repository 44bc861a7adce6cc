#pragma once
/*
===============================================================================
LOGGING — The library's named spdlog logger
===============================================================================

OVERVIEW
--------
All library diagnostics go through one spdlog logger named "evtol", created
on first use with a colored stderr sink and level `warn`. Applications raise
the level to see build and solve traces:

    evtol::setLogLevel(spdlog::level::debug);

If the application registers its own logger named "evtol" before first use,
that logger is used instead.

LEVELS
------
• debug — node built, composer totals, substitutions, log-space rows
• info  — solve start / solve end
• warn  — unused free Variables, solved values pinned at the log bound

Solver console output is separate (SolverAdapter::quiet / verbose).

===============================================================================
*/

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace evtol {

    inline constexpr const char* kLoggerName = "evtol";

    /// @brief The shared "evtol" logger
    inline std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = [] {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return instance;
    }

    inline void setLogLevel(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

} // namespace evtol
