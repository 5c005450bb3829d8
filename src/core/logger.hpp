/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 *
 * ILogSink is the runtime-configurable destination (file, stdout, null);
 * Logger is the thread-safe front-end shared by the reconcile loop and the
 * profile watcher thread. Each record is a single NDJSON line.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace kube_balance {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

// ─────────────────────────────────────────────
// ILogSink
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Escape a string for embedding inside a JSON string literal.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/// Extra string members appended to a record, e.g. `{{"node", "node-b"}}`.
using LogFields = std::initializer_list<std::pair<std::string_view, std::string_view>>;

/**
 * @brief Thread-safe logger front-end.
 *
 * Records look like
 * `{"level":"info","ts":"2025-06-01T12:00:00.000Z","msg":"...","node":"node-b"}`;
 * fields never override the three fixed members.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);
    void log(LogLevel level, std::string_view message, LogFields fields);
    void flush();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= level_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> level_;
    std::mutex mutex_;
};

}  // namespace kube_balance
