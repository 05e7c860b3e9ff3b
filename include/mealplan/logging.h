#pragma once
/*
===============================================================================
LOGGING — Leveled diagnostics sink for the planner
===============================================================================

OVERVIEW
--------
The planner reports its progress (state transitions, solver outcomes, GA
convergence, fallback warnings) through a Logger owned by the caller. A
Logger writes formatted lines to any std::ostream and drops messages below
its level. Gurobi's own log is separate and controlled by SolverSettings.

    Logger log(std::cerr, LogLevel::Info);
    log.info("exact solve: {} ({:.2f}s)", status, seconds);

Output format:

    [mealplan][INFO] exact solve: OPTIMAL (0.42s)

THREAD SAFETY
-------------
• A Logger may be shared by concurrent planner calls only if its stream is
  safe for concurrent writes; each line is emitted with a single insertion

===============================================================================
*/

#include <format>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace mealplan {

    enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

    inline std::string_view logLevelName(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info:  return "INFO";
            case LogLevel::Warn:  return "WARN";
            case LogLevel::Error: return "ERROR";
            case LogLevel::Off:   return "OFF";
        }
        return "?";
    }

    /**
     * @class Logger
     * @brief Level filter in front of an output stream
     *
     * @note The stream must outlive the Logger.
     */
    class Logger {
    public:
        /// @brief Warnings and errors to std::clog
        Logger() = default;

        Logger(std::ostream& sink, LogLevel level)
            : sink_(&sink), level_(level)
        {
        }

        /// @brief Logger that discards everything
        static Logger silent() { return Logger(std::clog, LogLevel::Off); }

        [[nodiscard]] LogLevel level() const noexcept { return level_; }
        void setLevel(LogLevel level) noexcept { level_ = level; }

        [[nodiscard]] bool enabled(LogLevel level) const noexcept {
            return level != LogLevel::Off && level >= level_;
        }

        template<typename... Args>
        void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) const {
            if (!enabled(level)) return;
            std::string line = std::format("[mealplan][{}] ", logLevelName(level));
            line += std::format(fmt, std::forward<Args>(args)...);
            line += '\n';
            *sink_ << line;
        }

        template<typename... Args>
        void debug(std::format_string<Args...> fmt, Args&&... args) const {
            log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void info(std::format_string<Args...> fmt, Args&&... args) const {
            log(LogLevel::Info, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void warn(std::format_string<Args...> fmt, Args&&... args) const {
            log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void error(std::format_string<Args...> fmt, Args&&... args) const {
            log(LogLevel::Error, fmt, std::forward<Args>(args)...);
        }

    private:
        std::ostream* sink_ = &std::clog;
        LogLevel level_ = LogLevel::Warn;
    };

} // namespace mealplan
