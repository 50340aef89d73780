#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>

namespace difftrace::core {

    enum class LogLevel : std::uint8_t {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
        Trace = 4,
        Off = 255,
    };

    const char *log_level_name(LogLevel lvl) noexcept;

    // Parses "error", "warn", "info", "debug", "trace", "off" (case-insensitive).
    std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

    inline bool log_enabled(LogLevel configured, LogLevel msg) noexcept {
        if (configured == LogLevel::Off || msg == LogLevel::Off)
            return false;
        return static_cast<std::uint8_t>(msg) <= static_cast<std::uint8_t>(configured);
    }

    // Process-wide leveled logger writing one line per message to a FILE* sink.
    // The initial level comes from DIFFTRACE_LOG_LEVEL, defaulting to Warn.
    class Logger {
      public:
        static Logger &instance();

        void set_level(LogLevel lvl) { level_.store(lvl, std::memory_order_relaxed); }
        LogLevel level() const noexcept { return level_.load(std::memory_order_relaxed); }

        // nullptr silences output without changing the level.
        void set_sink(FILE *f);

        bool enabled(LogLevel lvl) const noexcept { return log_enabled(level(), lvl); }

#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        void logf(LogLevel lvl, const char *fmt, ...);

      private:
        Logger();

        mutable std::mutex mu_;
        std::atomic<LogLevel> level_{LogLevel::Warn};
        FILE *sink_ = stderr;
    };

} // namespace difftrace::core
