/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Tests for logger.hxx: level filtering, record format and output targets.
 *
 * Compile (C++20):
 *   g++ -std=c++20 -O2 test.cpp -o logger_test && ./logger_test
 */

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include <unistd.h>

#include "../testing/test_main.hpp"
#include "logger.hxx"

namespace {

// Points the logger at a string stream and restores the defaults afterwards.
class Redirect {
   public:
    explicit Redirect(Logger::level min_level) {
        Logger::get_instance().configure({.use_colors = false, .min_level = min_level});
        Logger::get_instance().set_stream(&buffer_);
    }
    ~Redirect() {
        Logger::get_instance().set_stream(nullptr);
        log_init();
    }
    Redirect(const Redirect&) = delete;
    auto operator=(const Redirect&) -> Redirect& = delete;

    [[nodiscard]] auto text() const -> std::string { return buffer_.str(); }

   private:
    std::ostringstream buffer_;
};

}  // namespace

TEST_SUITE("Logger – levels")

TEST_CASE("messages below the minimum level are dropped") {
    Redirect out(Logger::level::WARNING);
    LOG_INFO << "hidden";
    LOG_DEBUG << "hidden too";
    LOG_WARN << "shown";
    expect(out.text()).not_to_contain("hidden");
    expect(out.text()).to_contain("shown");
}

TEST_CASE("set_min_level takes effect immediately") {
    Redirect out(Logger::level::ERROR);
    LOG_INFO << "before";
    Logger::get_instance().set_min_level(Logger::level::DEBUG);
    LOG_DEBUG << "after";
    expect(out.text()).not_to_contain("before");
    expect(out.text()).to_contain("after");
    expect(Logger::get_instance().min_level() == Logger::level::DEBUG).to_be_true();
}

TEST_CASE("the default minimum level is INFO") {
    log_init();
    expect(Logger::get_instance().min_level() == Logger::level::INFO).to_be_true();
}

TEST_SUITE("Logger – format")

TEST_CASE("records carry a time tag and a level tag") {
    Redirect out(Logger::level::BASIC);
    LOG_WARN << "action " << 3 << " still running";
    expect(out.text()).to_contain("[00:");
    expect(out.text()).to_contain("[WARNING] action 3 still running\n");
}

TEST_CASE("BASIC records have no level tag") {
    Redirect out(Logger::level::BASIC);
    LOG << "plain";
    expect(out.text()).to_contain("] plain\n");
    expect(out.text()).not_to_contain("[       ]");
}

TEST_CASE("empty stream messages are not written") {
    Redirect out(Logger::level::BASIC);
    { auto stream = LOG_INFO; }
    expect(out.text().empty()).to_be_true();
}

TEST_CASE("LOG_ERROR records carry the ERROR tag") {
    Redirect out(Logger::level::WARNING);
    LOG_ERROR << "scoped action 'load' could not be recorded";
    expect(out.text()).to_contain("[ ERROR ] scoped action 'load' could not be recorded\n");
}

TEST_CASE("format_time renders hours, minutes, seconds and milliseconds") {
    expect(Logger::format_time(0.0)).to_equal("00:00:00.000");
    expect(Logger::format_time(3723.5)).to_equal("01:02:03.500");
}

TEST_CASE("label_of returns fixed-width tags") {
    expect(std::string(Logger::label_of(Logger::level::INFO))).to_equal("  INFO ");
    expect(std::string(Logger::label_of(Logger::level::ERROR)).size()).to_equal(7);
}

TEST_SUITE("Logger – targets")

TEST_CASE("file output receives uncolored records") {
    const auto path = std::filesystem::temp_directory_path() / "action_profiler_logger_test.log";
    std::filesystem::remove(path);
    Logger::get_instance().configure({.write_to_file = true, .file_path = path.string(), .min_level = Logger::level::INFO});
    LOG_INFO << "to file";
    log_init();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    expect(content).to_contain("[  INFO ] to file\n");
    expect(content).not_to_contain("\033[");
    std::filesystem::remove(path);
}

TEST_CASE("console records are colored only when their own stream is a terminal") {
    log_init();
    std::ostringstream captured;
    std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());
    LOG_INFO << "to stdout";
    std::cout.rdbuf(previous);

    expect(captured.str()).to_contain("to stdout\n");
    if (isatty(fileno(stdout)) == 0) {
        expect(captured.str()).not_to_contain("\033[");
    }
}

TEST_CASE("an unwritable log file throws runtime_error") {
    expect_throws(std::runtime_error,
                  Logger::get_instance().configure({.write_to_file = true, .file_path = "/nonexistent-dir/action_profiler.log"}));
    log_init();
}
