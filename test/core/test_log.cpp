#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace mcp_fleet;

namespace {

LogRecord Record(LogLevel level, std::string_view component, std::string_view message,
                 std::string_view backend = {}) {
    LogRecord record;
    record.time = std::chrono::system_clock::now();
    record.level = level;
    record.component = component;
    record.backend = backend;
    record.message = message;
    return record;
}

} // anonymous namespace

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string backend;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(const LogRecord& record) override {
        messages.push_back({record.level, std::string(record.component),
                            std::string(record.backend), std::string(record.message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: accepts names case-insensitively", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("critical") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("loud").has_value());
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(Record(LogLevel::Info, "registry", "started time"));

    auto line = oss.str();
    CHECK(line.back() == '\n');
    auto parsed = nlohmann::json::parse(line);
    CHECK(parsed["level"] == "INFO");
    CHECK(parsed["component"] == "registry");
    CHECK(parsed["message"] == "started time");
    CHECK(parsed["ts"].get<std::string>().back() == 'Z');
    CHECK_FALSE(parsed.contains("backend"));
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(Record(LogLevel::Warn, "stderr", "line with \"quotes\"\nand newline", "time"));

    auto line = oss.str();
    CHECK(std::count(line.begin(), line.end(), '\n') == 1);
    auto parsed = nlohmann::json::parse(line);
    CHECK(parsed["backend"] == "time");
    CHECK(parsed["message"] == "line with \"quotes\"\nand newline");
}

TEST_CASE("JsonSink: invalid UTF-8 from a backend is replaced", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(Record(LogLevel::Info, "stderr", "bad \xff byte", "fs"));

    auto parsed = nlohmann::json::parse(oss.str());
    CHECK(parsed["message"].get<std::string>().find("bad ") == 0);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);
    sink.Write(Record(LogLevel::Error, "socket", "bind failed"));
    sink.Write(Record(LogLevel::Info, "stderr", "listening", "time"));

    auto out = oss.str();
    CHECK(out.find("\033[") == std::string::npos);
    CHECK(out.find("ERROR socket: bind failed\n") != std::string::npos);
    CHECK(out.find("INFO  stderr/time: listening\n") != std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);
    sink.Write(Record(LogLevel::Warn, "socket", "slow client"));
    CHECK(oss.str().find("\033[") != std::string::npos);
}

// ===========================================================================
// FileSink / TeeSink
// ===========================================================================

TEST_CASE("FileSink: appends lines to the file", "[log]") {
    auto path = (std::filesystem::temp_directory_path() / "mcp_fleet_test_log.txt").string();
    std::remove(path.c_str());
    {
        FileSink sink(path, false);
        sink.Write(Record(LogLevel::Info, "main", "first"));
        sink.Write(Record(LogLevel::Info, "main", "second"));
    }
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(content.find("main: first") != std::string::npos);
    CHECK(content.find("main: second") != std::string::npos);
    std::remove(path.c_str());
}

TEST_CASE("TeeSink: forwards to both sinks", "[log]") {
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* a = first.get();
    auto* b = second.get();
    TeeSink tee(std::move(first), std::move(second));

    tee.Write(Record(LogLevel::Debug, "c", "m"));

    REQUIRE(a->messages.size() == 1);
    REQUIRE(b->messages.size() == 1);
    CHECK(b->messages[0].message == "m");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel changes filtering dynamically", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    logger.Info("c", "filtered");
    logger.SetLevel(LogLevel::Debug);
    logger.Info("c", "passes");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "passes");
    CHECK(logger.Enabled(LogLevel::Debug));
}

TEST_CASE("Logger: backend-attributed records", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Info);

    logger.Log(LogLevel::Info, "stderr", "ready", "time");
    logger.Log(LogLevel::Debug, "stderr", "filtered", "time");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].backend == "time");
    CHECK(sink_ptr->messages[0].component == "stderr");
}

TEST_CASE("Logger: concurrent logging does not crash", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 50; ++i) {
                logger.Info("thread" + std::to_string(t), "message " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(sink_ptr->messages.size() == 200);
}
