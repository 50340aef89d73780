#include "difftrace/core/log.hpp"
#include <cctype>
#include <cstdarg>
#include <cstdlib>
#include <string>

namespace difftrace::core {

    const char *log_level_name(LogLevel lvl) noexcept {
        switch (lvl) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Off:
            return "OFF";
        }
        return "UNKNOWN";
    }

    std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
        std::string lower;
        lower.reserve(name.size());
        for (char c : name)
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (lower == "error")
            return LogLevel::Error;
        if (lower == "warn" || lower == "warning")
            return LogLevel::Warn;
        if (lower == "info")
            return LogLevel::Info;
        if (lower == "debug")
            return LogLevel::Debug;
        if (lower == "trace")
            return LogLevel::Trace;
        if (lower == "off" || lower == "none")
            return LogLevel::Off;
        return std::nullopt;
    }

    Logger::Logger() {
        if (const char *env = std::getenv("DIFFTRACE_LOG_LEVEL")) {
            if (auto lvl = parse_log_level(env))
                level_.store(*lvl, std::memory_order_relaxed);
        }
    }

    Logger &Logger::instance() {
        static Logger g;
        return g;
    }

    void Logger::set_sink(FILE *f) {
        std::lock_guard<std::mutex> lk(mu_);
        sink_ = f;
    }

    void Logger::logf(LogLevel lvl, const char *fmt, ...) {
        if (!enabled(lvl))
            return;

        char buf[1024];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(buf, sizeof(buf), fmt, args);
        va_end(args);

        std::lock_guard<std::mutex> lk(mu_);
        if (!sink_)
            return;
        std::fprintf(sink_, "[difftrace][%s] %s\n", log_level_name(lvl), buf);
        std::fflush(sink_);
    }

} // namespace difftrace::core
