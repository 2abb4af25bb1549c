#include <catch2/catch.hpp>
#include <streamecho/log/logger.hpp>
#include <streamecho/log/macros.hpp>

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

using namespace streamecho::log;

namespace {

// Redirects the logger into a temporary file for the lifetime of the guard
class captured_sink {
public:
    captured_sink() : file_(std::tmpfile()) {
        logger::instance().set_sink(file_);
    }

    ~captured_sink() {
        logger::instance().set_sink(nullptr);
        if (file_) {
            std::fclose(file_);
        }
    }

    std::string contents() const {
        std::string out;
        std::fflush(file_);
        std::rewind(file_);
        char buf[512];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
            out.append(buf, n);
        }
        return out;
    }

private:
    std::FILE* file_;
};

} // namespace

TEST_CASE("Logger singleton", "[logger]") {
    auto& logger1 = logger::instance();
    auto& logger2 = logger::instance();

    REQUIRE(&logger1 == &logger2);
}

TEST_CASE("Log level filtering", "[logger]") {
    auto& log = logger::instance();
    captured_sink sink;

    log.set_level(level::warning);
    REQUIRE(log.get_level() == level::warning);
    REQUIRE_FALSE(log.enabled(level::info));
    REQUIRE(log.enabled(level::error));

    auto before = log.lines_written();
    STREAMECHO_LOG_INFO("filtered out");
    STREAMECHO_LOG_WARNING("kept warning");
    STREAMECHO_LOG_ERROR("kept error");
    REQUIRE(log.lines_written() - before == 2);

    auto text = sink.contents();
    REQUIRE(text.find("filtered out") == std::string::npos);
    REQUIRE(text.find("kept warning") != std::string::npos);
    REQUIRE(text.find("[ERROR]") != std::string::npos);

    log.set_level(level::info);
}

TEST_CASE("Log line carries file and line", "[logger]") {
    auto& log = logger::instance();
    log.set_level(level::info);
    captured_sink sink;

    STREAMECHO_LOG_INFO("value={} name={}", 42, "x");

    auto text = sink.contents();
    REQUIRE(text.find("[INFO]") != std::string::npos);
    REQUIRE(text.find("[test_logger.cpp:") != std::string::npos);
    REQUIRE(text.find("value=42 name=x") != std::string::npos);
    // Not a terminal, so no colour escapes
    REQUIRE(text.find("\033[") == std::string::npos);
}

TEST_CASE("Log level conversion", "[logger]") {
    REQUIRE(std::string(level_to_string(level::debug)) == "DEBUG");
    REQUIRE(std::string(level_to_string(level::info)) == "INFO");
    REQUIRE(std::string(level_to_string(level::warning)) == "WARN");
    REQUIRE(std::string(level_to_string(level::error)) == "ERROR");
}

TEST_CASE("Log level parsing", "[logger]") {
    REQUIRE(parse_level("debug") == level::debug);
    REQUIRE(parse_level("info") == level::info);
    REQUIRE(parse_level("warn") == level::warning);
    REQUIRE(parse_level("warning") == level::warning);
    REQUIRE(parse_level("error") == level::error);
    REQUIRE_FALSE(parse_level("verbose").has_value());
    REQUIRE_FALSE(parse_level("").has_value());
}

TEST_CASE("Concurrent logging", "[logger]") {
    auto& log = logger::instance();
    log.set_level(level::info);
    captured_sink sink;

    constexpr int num_threads = 8;
    constexpr int logs_per_thread = 50;
    auto before = log.lines_written();

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i] {
            for (int j = 0; j < logs_per_thread; ++j) {
                STREAMECHO_LOG_INFO("Thread {} log {}", i, j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(log.lines_written() - before == num_threads * logs_per_thread);

    // Lines are never interleaved
    auto text = sink.contents();
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') ++lines;
    }
    REQUIRE(lines == num_threads * logs_per_thread);
}
