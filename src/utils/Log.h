// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file Log.h
 * @brief Minimal leveled logging for the vault library
 *
 * Messages are formatted with C++23 std::format (format strings are checked
 * at compile time) and written to std::cerr with a millisecond timestamp.
 *
 * @code
 * TotpVault::Log::set_level(TotpVault::Log::Level::Debug);
 * TotpVault::Log::info("Vault unlocked: {}", path);
 * TotpVault::Log::error("Rename failed for {}: {}", path, reason);
 * @endcode
 *
 * @warning Never pass secrets, passwords or derived keys to these functions.
 * @note Default level is Info.
 */

#ifndef TOTPVAULT_LOG_H
#define TOTPVAULT_LOG_H

#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <string>
#include <string_view>

namespace TotpVault::Log {

/**
 * @brief Log severity levels, lowest first
 */
enum class Level {
    Debug,     ///< Verbose diagnostics (entry names, parameter choices)
    Info,      ///< Normal lifecycle events
    Warning,   ///< Recoverable problems
    Error      ///< Failed operations
};

/// Messages below this level are dropped. Change with set_level().
inline Level current_level = Level::Info;

namespace detail {
    inline constexpr std::string_view level_to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug:   return "DEBUG";
            case Level::Info:    return "INFO ";
            case Level::Warning: return "WARN ";
            case Level::Error:   return "ERROR";
        }
        return "?????";
    }

    // YYYY-MM-DD HH:MM:SS.mmm in local time
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t, &tm);

        return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms.count()));
    }
}

/**
 * @brief Format and emit one log line if @p level passes the filter
 * @param level Severity of this message
 * @param fmt Format string (validated at compile time)
 * @param args Format arguments
 */
template<typename... Args>
void log(Level level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < current_level) {
        return;
    }

    auto message = std::format(fmt, std::forward<Args>(args)...);

    // Format: [TIMESTAMP] LEVEL: message
    std::cerr << std::format("[{}] {}: {}\n",
        detail::get_timestamp(), detail::level_to_string(level), message);
}

template<typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Warning, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    log(Level::Error, fmt, std::forward<Args>(args)...);
}

/**
 * @brief Set minimum log level at runtime
 * @param level New minimum level
 */
inline void set_level(Level level) {
    current_level = level;
}

} // namespace TotpVault::Log

#endif // TOTPVAULT_LOG_H
