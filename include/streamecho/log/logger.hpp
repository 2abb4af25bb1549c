#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string_view>
#include <unistd.h>

namespace streamecho::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";
    }
}

/// Parse a level name as accepted on the command line
constexpr std::optional<level> parse_level(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn" || name == "warning") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

/// Process-wide logger.
///
/// Lines are written as `[TIMESTAMP] [LEVEL] [file:line] message`. Colour
/// escapes are only emitted when the sink is a terminal.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output. The sink is not owned; nullptr restores stderr.
    void set_sink(std::FILE* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink ? sink : stderr;
        colored_ = ::isatty(::fileno(sink_)) == 1;
    }

    /// Number of lines written since start (filtered lines are not counted)
    uint64_t lines_written() const noexcept {
        return lines_written_.load(std::memory_order_relaxed);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(sink_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored_ ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            short_file_name(file),
            line,
            msg,
            colored_ ? "\033[0m" : ""
        );
        std::fflush(sink_);
        lines_written_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    logger() noexcept
        : min_level_(level::info)
        , sink_(stderr)
        , colored_(::isatty(STDERR_FILENO) == 1) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static constexpr std::string_view short_file_name(std::string_view path) noexcept {
        auto pos = path.find_last_of('/');
        return pos == std::string_view::npos ? path : path.substr(pos + 1);
    }

    std::atomic<level> min_level_;
    std::atomic<uint64_t> lines_written_{0};
    std::mutex mutex_;  // guards sink_ and serialises writes
    std::FILE* sink_;
    bool colored_;
};

} // namespace streamecho::log
