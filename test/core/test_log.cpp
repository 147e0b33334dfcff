#include <catch2/catch_test_macros.hpp>

#include <rdf_sync/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace rdf_sync;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back({level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// Forwards to a CaptureSink owned by the test.
class ForwardSink : public ILogSink {
public:
    explicit ForwardSink(CaptureSink& target) : target_(target) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        target_.Write(level, component, message);
    }
private:
    CaptureSink& target_;
};

} // anonymous namespace

TEST_CASE("ParseLogLevel: names are case-insensitive", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("INFO") == LogLevel::Info);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("trace").has_value());
}

TEST_CASE("JsonSink: writes one JSON line per message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Info, "workflow", "DISCOVERING -> POPULATION_COMPARED");
    sink.Write(LogLevel::Warn, "canon", "budget");

    auto out = oss.str();
    CHECK(out.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(out.find("\"component\":\"workflow\"") != std::string::npos);
    CHECK(out.find("\"message\":\"DISCOVERING -> POPULATION_COMPARED\"") != std::string::npos);
    CHECK(out.find("\"ts\":\"") != std::string::npos);
    CHECK(std::count(out.begin(), out.end(), '\n') == 2);
}

TEST_CASE("JsonSink: escapes quotes and control characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);
    sink.Write(LogLevel::Error, "sparql", "literal \"x\"\n\x01");
    auto out = oss.str();
    CHECK(out.find(R"(literal \"x\"\n\u0001)") != std::string::npos);
}

TEST_CASE("JsonFileSink: appends to file", "[log]") {
    auto path = (std::filesystem::temp_directory_path() / "rdf_sync_log_test.jsonl").string();
    std::remove(path.c_str());
    {
        JsonFileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "main", "first");
    }
    {
        JsonFileSink sink(path);
        sink.Write(LogLevel::Info, "main", "second");
    }
    std::ifstream in(path);
    std::string line1, line2;
    std::getline(in, line1);
    std::getline(in, line2);
    CHECK(line1.find("first") != std::string::npos);
    CHECK(line2.find("second") != std::string::npos);
    in.close();
    std::remove(path.c_str());
}

TEST_CASE("JsonFileSink: unopenable path is ignored", "[log]") {
    JsonFileSink sink("/nonexistent-dir/rdf-sync/log.jsonl");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "main", "dropped");
}

TEST_CASE("TeeSink: writes to every child", "[log]") {
    CaptureSink a;
    CaptureSink b;
    TeeSink tee;
    tee.Add(std::make_unique<ForwardSink>(a));
    tee.Add(std::make_unique<ForwardSink>(b));
    tee.Add(nullptr);
    tee.Write(LogLevel::Warn, "config", "ignored --type");
    REQUIRE(a.messages.size() == 1);
    REQUIRE(b.messages.size() == 1);
    CHECK(b.messages[0].message == "ignored --type");
}

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("t", "d");
    logger.Info("t", "i");
    logger.Warn("t", "w");
    logger.Error("t", "e");

    REQUIRE(captured->messages.size() == 2);
    CHECK(captured->messages[0].level == LogLevel::Warn);
    CHECK(captured->messages[1].level == LogLevel::Error);
    CHECK_FALSE(logger.Enabled(LogLevel::Info));

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));
    logger.Debug("t", "now visible");
    CHECK(captured->messages.size() == 3);
}

TEST_CASE("Logger: concurrent logging keeps every message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 4;
    constexpr int kMessages = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessages; ++i) {
                logger.Info("discover-" + std::to_string(t), std::to_string(i));
            }
        });
    }
    for (auto& th : threads) th.join();
    CHECK(captured->messages.size() == kThreads * kMessages);
}

TEST_CASE("ColorConsoleSink: plain mode has no ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);
    sink.Write(LogLevel::Info, "sparql", "GET https://lindas.admin.ch/query");
    auto out = oss.str();
    CHECK(out.find("[INFO]") != std::string::npos);
    CHECK(out.find("[sparql]") != std::string::npos);
    CHECK(out.find("GET https://lindas.admin.ch/query") != std::string::npos);
    CHECK(out.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode uses ANSI codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);
    sink.Write(LogLevel::Error, "workflow", "failed");
    auto out = oss.str();
    CHECK(out.find("\033[") != std::string::npos);
    CHECK(out.find("ERROR") != std::string::npos);
    CHECK(out.find("failed") != std::string::npos);
}
