#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_fleet {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// "DEBUG", "INFO", "WARN" or "ERROR".
[[nodiscard]] const char* LogLevelName(LogLevel level);

/// Parse "debug", "info", "warn"/"warning", "error"/"critical" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view name);

// One log event. The views are only valid for the duration of Write().
struct LogRecord {
    std::chrono::system_clock::time_point time;
    LogLevel level = LogLevel::Info;
    std::string_view component;
    std::string_view backend;  // empty unless the event concerns one backend
    std::string_view message;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Compact colored lines for an interactive terminal. With use_color false it
// falls back to the plain timestamped format used by FileSink.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line. Invalid UTF-8 (common in backend stderr) is
// replaced rather than dropped.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// Appends to log_file; flushed per record so a crashed gateway keeps its tail.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, bool json);
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(const LogRecord& record) override;
private:
    std::ofstream file_;
    bool json_;
};

class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(const LogRecord& record) override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

// Filters by level and serializes writes to the sink. The level check is
// lock-free so disabled debug logging on hot paths costs one atomic load.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool Enabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component,
             std::string_view message, std::string_view backend = {});

    void Debug(std::string_view component, std::string_view message) {
        Log(LogLevel::Debug, component, message);
    }
    void Info(std::string_view component, std::string_view message) {
        Log(LogLevel::Info, component, message);
    }
    void Warn(std::string_view component, std::string_view message) {
        Log(LogLevel::Warn, component, message);
    }
    void Error(std::string_view component, std::string_view message) {
        Log(LogLevel::Error, component, message);
    }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    std::mutex write_mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger
// ---------------------------------------------------------------------------

/// Install the global logger. Call before any worker thread starts; until
/// then everything below Error is discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

/// A line a backend wrote to its stderr, attributed to that backend.
void LogBackendLine(std::string_view backend, std::string_view line);

} // namespace mcp_fleet
