#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_fleet {

namespace {

std::string FormatTime(std::chrono::system_clock::time_point time, bool utc_with_millis) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm parts{};
    std::ostringstream oss;
    if (utc_with_millis) {
        gmtime_r(&seconds, &parts);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            time.time_since_epoch()).count() % 1000;
        oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms << 'Z';
    } else {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
    }
    return oss.str();
}

// "registry" or "backend/time"
void WriteSource(std::ostream& out, const LogRecord& record) {
    out << record.component;
    if (!record.backend.empty()) {
        out << '/' << record.backend;
    }
}

// 2026-10-19T08:15:02.041Z WARN  registry/time: restart after send failure
void WritePlain(std::ostream& out, const LogRecord& record) {
    out << FormatTime(record.time, true) << ' '
        << std::left << std::setw(5) << LogLevelName(record.level) << std::right << ' ';
    WriteSource(out, record);
    out << ": " << record.message << '\n';
}

void WriteJson(std::ostream& out, const LogRecord& record) {
    nlohmann::json line = {
        {"ts", FormatTime(record.time, true)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
    };
    if (!record.backend.empty()) {
        line["backend"] = std::string(record.backend);
    }
    line["message"] = std::string(record.message);
    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return ansi::kReset;
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
    return slot;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error" || lower == "critical") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------

ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        WritePlain(out_, record);
        return;
    }
    const char* color = LevelColor(record.level);
    out_ << ansi::kDim << FormatTime(record.time, false) << ansi::kReset << ' '
         << color << std::left << std::setw(5) << LogLevelName(record.level)
         << std::right << ansi::kReset << ' '
         << ansi::kDim << record.component << ansi::kReset;
    if (!record.backend.empty()) {
        out_ << ansi::kMagenta << '/' << record.backend << ansi::kReset;
    }
    out_ << ' ';
    if (record.level == LogLevel::Error) {
        out_ << color << record.message << ansi::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    WriteJson(out_, record);
}

FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::app), json_(json) {}

void FileSink::Write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    if (json_) {
        WriteJson(file_, record);
    } else {
        WritePlain(file_, record);
    }
    file_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(const LogRecord& record) {
    first_->Write(record);
    second_->Write(record);
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    min_level_.store(level);
}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message, std::string_view backend) {
    if (!Enabled(level)) {
        return;
    }
    LogRecord record;
    record.time = std::chrono::system_clock::now();
    record.level = level;
    record.component = component;
    record.backend = backend;
    record.message = message;

    std::lock_guard<std::mutex> lock(write_mutex_);
    sink_->Write(record);
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerSlot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

void LogBackendLine(std::string_view backend, std::string_view line) {
    GlobalLogger().Log(LogLevel::Info, "stderr", line, backend);
}

} // namespace mcp_fleet
