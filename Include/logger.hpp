#pragma once

#include <ostream>
#include <iostream>
#include <string_view>

// ============================================================
//  Logger  –  thin level filter over an std::ostream
// ============================================================

enum class LogLevel { Debug, Info, Warning, Error };

[[nodiscard]] constexpr std::string_view levelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:   return "[DEBUG] ";
        case LogLevel::Info:    return "[INFO] ";
        case LogLevel::Warning: return "[WARN] ";
        case LogLevel::Error:   return "[ERROR] ";
    }
    return "[?] ";
}

/**
 * Writes one tagged line per message to the attached stream.
 * Messages below the threshold are dropped; a null sink drops everything.
 * Loggers are plain values and are handed to whoever needs one.
 */
class Logger {
public:
    explicit Logger(std::ostream* sink = &std::clog,
                    LogLevel threshold = LogLevel::Info) noexcept
        : sink_(sink), threshold_(threshold)
    {}

    /// Warnings and errors to std::clog; the default for engine components.
    [[nodiscard]] static Logger warnings() noexcept { return Logger{ &std::clog, LogLevel::Warning }; }

    /// A logger that writes nothing.
    [[nodiscard]] static Logger silent() noexcept { return Logger{ nullptr }; }

    void setSink(std::ostream* sink)   noexcept { sink_ = sink; }
    void setThreshold(LogLevel level)  noexcept { threshold_ = level; }

    [[nodiscard]] LogLevel threshold() const noexcept { return threshold_; }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept {
        return sink_ != nullptr && level >= threshold_;
    }

    void log(LogLevel level, std::string_view message) const {
        if (!enabled(level)) return;
        *sink_ << levelTag(level) << message << '\n';
    }

    void debug(std::string_view m) const { log(LogLevel::Debug,   m); }
    void info (std::string_view m) const { log(LogLevel::Info,    m); }
    void warn (std::string_view m) const { log(LogLevel::Warning, m); }
    void error(std::string_view m) const { log(LogLevel::Error,   m); }

private:
    std::ostream* sink_;
    LogLevel      threshold_;
};
