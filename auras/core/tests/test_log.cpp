#include <catch2/catch_test_macros.hpp>
#include <auras/core/log.hpp>
#include <string>
#include <utility>
#include <vector>

using namespace auras::core;

namespace {

class CaptureSink : public ILogSink {
public:
    void log(LogLevel level, const std::string&, const std::string& message) override {
        entries.emplace_back(level, message);
    }

    std::vector<std::pair<LogLevel, std::string>> entries;
};

// Restores the global level and sink list on scope exit
struct SinkGuard {
    explicit SinkGuard(ILogSink* sink) : m_sink(sink), m_level(get_log_level()) {
        add_log_sink(m_sink);
    }
    ~SinkGuard() {
        remove_log_sink(m_sink);
        set_log_level(m_level);
    }

    ILogSink* m_sink;
    LogLevel m_level;
};

} // anonymous namespace

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Info") == LogLevel::Info);
    REQUIRE(parse_log_level("warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
    REQUIRE(parse_log_level("fatal") == LogLevel::Fatal);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    SECTION("Names round trip") {
        for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Fatal}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Log sinks", "[core][log]") {
    CaptureSink sink;
    SinkGuard guard(&sink);

    SECTION("Formatted messages reach the sink") {
        set_log_level(LogLevel::Trace);
        log(LogLevel::Info, "[Test] {} + {} = {}", 1, 2, 3);

        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].first == LogLevel::Info);
        REQUIRE(sink.entries[0].second == "[Test] 1 + 2 = 3");
    }

    SECTION("Messages below the level are filtered") {
        set_log_level(LogLevel::Warn);
        log(LogLevel::Debug, "[Test] hidden {}", 1);
        log(LogLevel::Info, "[Test] hidden");
        log(LogLevel::Error, "[Test] shown");

        REQUIRE(sink.entries.size() == 1);
        REQUIRE(sink.entries[0].second == "[Test] shown");
    }

    SECTION("Removed sinks stop receiving") {
        set_log_level(LogLevel::Trace);
        remove_log_sink(&sink);
        log(LogLevel::Error, "[Test] dropped");
        REQUIRE(sink.entries.empty());
    }
}
