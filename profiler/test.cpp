/**
 * test.cpp
 * ─────────────────────────────────────────────────────────────────────────────
 * Test suite for profiler.hxx.
 *
 * Most tests run the profiler on ManualClock, a steady clock that only moves
 * when told to, so durations and percentages are exact.
 *
 * Compile (C++20):
 *   g++ -std=c++20 -O2 test.cpp -o profiler_test && ./profiler_test
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "profiler.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

using namespace std::chrono_literals;

struct ManualClock {
    using rep = std::int64_t;
    using period = std::nano;
    using duration = std::chrono::nanoseconds;
    using time_point = std::chrono::time_point<ManualClock>;
    static constexpr bool is_steady = true;

    static inline time_point current{};

    static auto now() noexcept -> time_point { return current; }
    static void advance(duration dur) { current += dur; }
    static void set(duration since_epoch) { current = time_point(since_epoch); }
};

using TestSession = BasicProfileSession<ManualClock>;

// Steady clock that can be told to fail on its next reading.
struct FailingClock {
    using rep = std::int64_t;
    using period = std::nano;
    using duration = std::chrono::nanoseconds;
    using time_point = std::chrono::time_point<FailingClock>;
    static constexpr bool is_steady = true;

    static inline bool fail_next = false;

    static auto now() -> time_point {
        if (fail_next) {
            fail_next = false;
            throw std::runtime_error("clock unavailable");
        }
        return time_point{};
    }
};

// Runs one start/advance/stop cycle.
auto timed_cycle(TestSession& session, const std::string& name, ManualClock::duration dur) -> double {
    session.start(name);
    ManualClock::advance(dur);
    return session.stop(name);
}

// Redirects the logger into a string for the lifetime of the object.
class LogCapture {
   public:
    explicit LogCapture(Logger::level min_level = Logger::level::INFO) : previous_level_(Logger::get_instance().min_level()) {
        Logger::get_instance().set_stream(&buffer_);
        Logger::get_instance().set_min_level(min_level);
    }
    ~LogCapture() {
        Logger::get_instance().set_stream(nullptr);
        Logger::get_instance().set_min_level(previous_level_);
    }
    LogCapture(const LogCapture&) = delete;
    auto operator=(const LogCapture&) -> LogCapture& = delete;

    [[nodiscard]] auto text() const -> std::string { return buffer_.str(); }

   private:
    std::ostringstream buffer_;
    Logger::level previous_level_;
};

auto count_lines(const std::string& text) -> std::size_t { return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')); }

auto line_at(const std::string& text, std::size_t index) -> std::string {
    std::istringstream iss(text);
    std::string line;
    for (std::size_t i = 0; i <= index; ++i) {
        if (!std::getline(iss, line)) {
            throw std::runtime_error("report has no line " + std::to_string(index));
        }
    }
    return line;
}

auto actions_of(const Report& report) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& row : report.rows) {
        names.push_back(row.action);
    }
    return names;
}

auto joined(const std::vector<std::string>& names) -> std::string {
    std::string out;
    for (const auto& name : names) {
        out += out.empty() ? name : "," + name;
    }
    return out;
}

struct LoadFailed : std::runtime_error {
    LoadFailed() : std::runtime_error("load failed") {}
};

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// ActiveTimerTable
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ActiveTimerTable")

TEST_CASE("start marks the action as active") {
    ManualClock::set(0s);
    ActiveTimerTable<ManualClock> table;
    table.start("load");
    expect(table.is_active("load")).to_be_true();
    expect(table.size()).to_equal(1);
}

TEST_CASE("stop returns the elapsed seconds and forwards them to the aggregator") {
    ManualClock::set(0s);
    ActiveTimerTable<ManualClock> table;
    Aggregator sink;
    table.start("load");
    ManualClock::advance(100ms);
    double elapsed = table.stop("load", sink);
    expect(elapsed).to_approx_equal(0.1, 1e-12);
    expect(table.is_active("load")).to_be_false();
    expect(sink.count("load")).to_equal(1);
    expect(sink.duration_sum("load")).to_approx_equal(0.1, 1e-12);
}

TEST_CASE("starting an active action throws DuplicateActionStart") {
    ActiveTimerTable<ManualClock> table;
    table.start("load");
    expect_throws(DuplicateActionStart, table.start("load"));
}

TEST_CASE("DuplicateActionStart names the action") {
    ActiveTimerTable<ManualClock> table;
    table.start("load");
    try {
        table.start("load");
    } catch (const DuplicateActionStart& e) {
        expect(e.action()).to_equal("load");
        expect(std::string(e.what())).to_contain("'load'");
        return;
    }
    throw std::runtime_error("DuplicateActionStart was not thrown");
}

TEST_CASE("a rejected start keeps the original start time") {
    ManualClock::set(0s);
    ActiveTimerTable<ManualClock> table;
    Aggregator sink;
    table.start("load");
    ManualClock::advance(40ms);
    expect_throws(DuplicateActionStart, table.start("load"));
    ManualClock::advance(60ms);
    expect(table.stop("load", sink)).to_approx_equal(0.1, 1e-12);
}

TEST_CASE("stopping an action that never started throws UnknownActionStop") {
    ActiveTimerTable<ManualClock> table;
    Aggregator sink;
    expect_throws(UnknownActionStop, table.stop("load", sink));
    expect(sink.empty()).to_be_true();
}

TEST_CASE("stopping twice throws on the second stop") {
    ActiveTimerTable<ManualClock> table;
    Aggregator sink;
    table.start("load");
    table.stop("load", sink);
    expect_throws(UnknownActionStop, table.stop("load", sink));
    expect(sink.count("load")).to_equal(1);
}

TEST_CASE("names() lists in-flight actions sorted") {
    ActiveTimerTable<ManualClock> table;
    table.start("write");
    table.start("load");
    table.start("parse");
    expect(joined(table.names())).to_equal("load,parse,write");
}

TEST_CASE("steady_clock elapsed time is never negative") {
    ActiveTimerTable<std::chrono::steady_clock> table;
    Aggregator sink;
    for (int i = 0; i < 100; ++i) {
        table.start("tick");
        expect(table.stop("tick", sink)).to_be_greater_or_equal(0.0);
    }
    expect(sink.count("tick")).to_equal(100);
}

// ═════════════════════════════════════════════════════════════════════════════
// Aggregator
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Aggregator")

TEST_CASE("unknown names have no record and zero totals") {
    Aggregator agg;
    expect(agg.find("load") == nullptr).to_be_true();
    expect(agg.count("load")).to_equal(0);
    expect(agg.duration_sum("load")).to_approx_equal(0.0);
}

TEST_CASE("record accumulates duration and count") {
    Aggregator agg;
    agg.record("load", 0.1);
    agg.record("load", 0.2);
    agg.record("load", 0.3);
    const AggregateRecord* rec = agg.find("load");
    expect(rec != nullptr).to_be_true();
    expect(rec->count).to_equal(3);
    expect(rec->duration_sum).to_approx_equal(0.6, 1e-12);
    expect(rec->mean()).to_approx_equal(0.2, 1e-12);
}

TEST_CASE("completion order follows first record only") {
    Aggregator agg;
    agg.record("write", 1.0);
    agg.record("load", 1.0);
    agg.record("write", 1.0);
    agg.record("parse", 1.0);
    expect(joined(agg.completion_order())).to_equal("write,load,parse");
    expect(agg.size()).to_equal(3);
}

TEST_CASE("a zero-length cycle still creates a record") {
    Aggregator agg;
    agg.record("noop", 0.0);
    expect(agg.count("noop")).to_equal(1);
    expect(agg.duration_sum("noop")).to_approx_equal(0.0);
}

// ═════════════════════════════════════════════════════════════════════════════
// ProfileSession
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ProfileSession")

TEST_CASE("two cycles of 100ms and 200ms sum to 300ms") {
    ManualClock::set(0s);
    TestSession session;
    expect(timed_cycle(session, "load", 100ms)).to_approx_equal(0.1, 1e-12);
    expect(session.count("load")).to_equal(1);
    expect(session.duration_sum("load")).to_approx_equal(0.1, 1e-12);

    expect(timed_cycle(session, "load", 200ms)).to_approx_equal(0.2, 1e-12);
    expect(session.count("load")).to_equal(2);
    expect(session.duration_sum("load")).to_approx_equal(0.3, 1e-12);

    Report report = session.make_report();
    expect(report.total_duration).to_approx_equal(0.3, 1e-12);
    expect(report.rows.size()).to_equal(1);
    expect(report.rows[0].percentage.value()).to_approx_equal(100.0, 1e-9);
    expect(report.rows[0].mean).to_approx_equal(0.15, 1e-12);
}

TEST_CASE("N cycles on steady_clock sum to the returned elapsed times") {
    ProfileSession session;
    double expected = 0.0;
    constexpr int CYCLES = 25;
    for (int i = 0; i < CYCLES; ++i) {
        session.start("spin");
        volatile int sink = 0;
        for (int j = 0; j < 1000; ++j) {
            sink = sink + j;
        }
        expected += session.stop("spin");
    }
    expect(session.count("spin")).to_equal(CYCLES);
    expect(session.duration_sum("spin")).to_approx_equal(expected, 1e-9);
}

TEST_CASE("start and stop errors propagate from the session") {
    TestSession session;
    session.start("load");
    expect_throws(DuplicateActionStart, session.start("load"));
    expect_throws(UnknownActionStop, session.stop("parse"));
    expect(session.is_active("load")).to_be_true();
    expect(session.active_count()).to_equal(1);
}

TEST_CASE("different names can be in flight at the same time") {
    ManualClock::set(0s);
    TestSession session;
    session.start("outer");
    ManualClock::advance(10ms);
    session.start("inner");
    ManualClock::advance(20ms);
    session.stop("inner");
    ManualClock::advance(10ms);
    session.stop("outer");
    expect(session.duration_sum("inner")).to_approx_equal(0.02, 1e-12);
    expect(session.duration_sum("outer")).to_approx_equal(0.04, 1e-12);
    expect(joined(session.aggregates().completion_order())).to_equal("inner,outer");
}

TEST_CASE("reset_start_time restarts the session clock and keeps aggregates") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "load", 1s);
    ManualClock::advance(1s);
    expect(session.session_duration()).to_approx_equal(2.0, 1e-12);

    session.reset_start_time();
    ManualClock::advance(4s);
    expect(session.session_duration()).to_approx_equal(4.0, 1e-12);
    expect(session.count("load")).to_equal(1);
    expect(session.make_report().rows[0].percentage.value()).to_approx_equal(25.0, 1e-9);
}

TEST_CASE("sessions are independent") {
    TestSession first;
    TestSession second;
    first.start("load");
    expect_no_throw(second.start("load"));
    first.stop("load");
    expect(first.count("load")).to_equal(1);
    expect(second.count("load")).to_equal(0);
    expect(second.is_active("load")).to_be_true();
}

// ═════════════════════════════════════════════════════════════════════════════
// ScopedAction
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ScopedAction")

TEST_CASE("the action stops when the scope ends") {
    ManualClock::set(0s);
    TestSession session;
    {
        auto scope = session.profile("load");
        expect(session.is_active("load")).to_be_true();
        ManualClock::advance(30ms);
    }
    expect(session.is_active("load")).to_be_false();
    expect(session.count("load")).to_equal(1);
    expect(session.duration_sum("load")).to_approx_equal(0.03, 1e-12);
}

TEST_CASE("the action stops exactly once when the scope throws") {
    ManualClock::set(0s);
    TestSession session;
    expect_throws(LoadFailed, {
        auto scope = session.profile("load");
        ManualClock::advance(5ms);
        throw LoadFailed();
    });
    expect(session.is_active("load")).to_be_false();
    expect(session.count("load")).to_equal(1);
    expect(session.duration_sum("load")).to_approx_equal(0.005, 1e-12);
}

TEST_CASE("leaving by an exception is logged at debug level") {
    LogCapture capture(Logger::level::DEBUG);
    TestSession session;
    try {
        auto scope = session.profile("load");
        throw LoadFailed();
    } catch (const LoadFailed&) {
    }
    expect(capture.text()).to_contain("action 'load' left by an exception");
}

TEST_CASE("the action stops on an early return") {
    TestSession session;
    auto find_first_even = [&session](const std::vector<int>& values) -> int {
        auto scope = session.profile("search");
        for (int val : values) {
            if (val % 2 == 0) {
                return val;
            }
        }
        return -1;
    };
    expect(find_first_even({1, 3, 4, 5})).to_equal(4);
    expect(find_first_even({1, 3})).to_equal(-1);
    expect(session.count("search")).to_equal(2);
    expect(session.active_count()).to_equal(0);
}

TEST_CASE("release stops early and the destructor does nothing more") {
    ManualClock::set(0s);
    TestSession session;
    {
        auto scope = session.profile("load");
        ManualClock::advance(10ms);
        expect(scope.release()).to_approx_equal(0.01, 1e-12);
        expect(scope.is_active()).to_be_false();
        ManualClock::advance(50ms);
    }
    expect(session.count("load")).to_equal(1);
    expect(session.duration_sum("load")).to_approx_equal(0.01, 1e-12);
}

TEST_CASE("releasing twice throws UnknownActionStop") {
    TestSession session;
    auto scope = session.profile("load");
    scope.release();
    expect_throws(UnknownActionStop, scope.release());
    expect(session.count("load")).to_equal(1);
}

TEST_CASE("a moved guard stops the action once") {
    TestSession session;
    {
        auto first = session.profile("load");
        auto second = std::move(first);
        expect(first.is_active()).to_be_false();
        expect(second.is_active()).to_be_true();
        expect(second.name()).to_equal("load");
    }
    expect(session.count("load")).to_equal(1);
}

TEST_CASE("acquiring an already running action throws and leaves it running") {
    TestSession session;
    session.start("load");
    expect_throws(DuplicateActionStart, auto scope = session.profile("load"));
    expect(session.is_active("load")).to_be_true();
    session.stop("load");
    expect(session.count("load")).to_equal(1);
}

TEST_CASE("a guard whose action was stopped elsewhere warns instead of throwing") {
    LogCapture capture;
    TestSession session;
    expect_no_throw({
        auto scope = session.profile("load");
        session.stop("load");
    });
    expect(session.count("load")).to_equal(1);
    expect(capture.text()).to_contain("scoped action 'load' was already stopped");
}

TEST_CASE("a stop that fails in the destructor is logged as an error instead of terminating") {
    LogCapture capture;
    BasicProfileSession<FailingClock> session;
    expect_no_throw({
        auto scope = session.profile("load");
        FailingClock::fail_next = true;
    });
    expect(capture.text()).to_contain("[ ERROR ] scoped action 'load' could not be recorded: clock unavailable");
    expect(session.count("load")).to_equal(0);
    expect(session.is_active("load")).to_be_true();
}

TEST_CASE("PROFILE_SCOPE times the rest of the block") {
    ManualClock::set(0s);
    TestSession session;
    {
        PROFILE_SCOPE(session, "block");
        ManualClock::advance(7ms);
    }
    expect(session.duration_sum("block")).to_approx_equal(0.007, 1e-12);
}

namespace {
void solve_step(TestSession& session) {
    PROFILE_FUNCTION(session);
    ManualClock::advance(3ms);
}
}  // namespace

TEST_CASE("PROFILE_FUNCTION uses the enclosing function name") {
    ManualClock::set(0s);
    TestSession session;
    solve_step(session);
    solve_step(session);
    expect(session.count("solve_step")).to_equal(2);
    expect(session.duration_sum("solve_step")).to_approx_equal(0.006, 1e-12);
}

// ═════════════════════════════════════════════════════════════════════════════
// wrap / profile_call
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("wrap")

TEST_CASE("wrapped callable returns the original result") {
    ManualClock::set(0s);
    TestSession session;
    auto add = wrap(session, "add", [](int lhs, int rhs) {
        ManualClock::advance(1ms);
        return lhs + rhs;
    });
    expect(add(2, 3)).to_equal(5);
    expect(add(10, -4)).to_equal(6);
    expect(session.count("add")).to_equal(2);
    expect(session.duration_sum("add")).to_approx_equal(0.002, 1e-12);
}

TEST_CASE("wrapped callable passes references through") {
    TestSession session;
    std::vector<int> values{1, 2, 3};
    auto push = wrap(session, "push", [](std::vector<int>& vec, int val) -> std::vector<int>& {
        vec.push_back(val);
        return vec;
    });
    std::vector<int>& same = push(values, 4);
    expect(&same == &values).to_be_true();
    expect(values.size()).to_equal(4);
}

TEST_CASE("wrapped callable propagates its exception and is still recorded") {
    TestSession session;
    auto load = wrap(session, "load", [](const std::string& path) -> std::string {
        if (path.empty()) {
            throw LoadFailed();
        }
        return "data:" + path;
    });
    expect(load("a.bin")).to_equal("data:a.bin");
    expect_throws(LoadFailed, load(""));
    expect(session.count("load")).to_equal(2);
    expect(session.is_active("load")).to_be_false();
}

TEST_CASE("wrapped callable keeps its own state between calls") {
    TestSession session;
    auto next = wrap(session, "next", [counter = 0]() mutable { return ++counter; });
    next();
    next();
    expect(next()).to_equal(3);
}

TEST_CASE("profile_call times a single invocation") {
    ManualClock::set(0s);
    TestSession session;
    int calls = 0;
    profile_call(session, "bump", [&calls](int step) {
        ManualClock::advance(2ms);
        calls += step;
    }, 5);
    expect(calls).to_equal(5);
    expect(session.count("bump")).to_equal(1);
    expect(profile_call(session, "square", [](int val) { return val * val; }, 9)).to_equal(81);
}

// ═════════════════════════════════════════════════════════════════════════════
// Report ranking
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Report ranking")

TEST_CASE("rows are ranked by descending percentage") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "parse", 10ms);
    timed_cycle(session, "solve", 70ms);
    timed_cycle(session, "write", 20ms);
    Report report = session.make_report();
    expect(joined(actions_of(report))).to_equal("solve,write,parse");
    for (std::size_t i = 1; i < report.rows.size(); ++i) {
        expect(*report.rows[i - 1].percentage).to_be_greater_or_equal(*report.rows[i].percentage);
    }
    expect(report.rows[0].percentage.value()).to_approx_equal(70.0, 1e-9);
}

TEST_CASE("equal percentages keep completion order") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "zeta", 50ms);
    timed_cycle(session, "alpha", 50ms);
    timed_cycle(session, "big", 100ms);
    timed_cycle(session, "mid", 50ms);
    Report report = session.make_report();
    expect(joined(actions_of(report))).to_equal("big,zeta,alpha,mid");
    expect(report.rows[1].completion_index).to_equal(0);
    expect(report.rows[2].completion_index).to_equal(1);
}

TEST_CASE("completion order is decided by the first completed cycle") {
    Aggregator agg;
    agg.record("late", 0.1);
    agg.record("early", 0.1);
    agg.record("late", 0.0);
    Report report = ReportGenerator{}.build(agg, 1.0);
    expect(joined(actions_of(report))).to_equal("late,early");
}

TEST_CASE("actions still in flight are left out and reported through the logger") {
    LogCapture capture;
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "load", 10ms);
    session.start("write");
    session.start("solve");
    ManualClock::advance(10ms);
    Report report = session.make_report();
    expect(joined(actions_of(report))).to_equal("load");
    expect(capture.text()).to_contain("2 action(s) still running, excluded from the report: solve, write");
}

TEST_CASE("a non-positive session duration leaves percentages empty") {
    LogCapture capture;
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "small", 10ms);
    timed_cycle(session, "large", 90ms);
    session.reset_start_time();
    Report report = session.make_report();
    expect(report.has_percentages()).to_be_false();
    expect(report.rows[0].percentage.has_value()).to_be_false();
    expect(joined(actions_of(report))).to_equal("small,large");
    expect(capture.text()).to_contain("percentages are not available");
}

TEST_CASE("a session start in the future renders n/a instead of dividing") {
    LogCapture capture;
    ManualClock::set(10s);
    TestSession session;
    timed_cycle(session, "load", 10ms);
    ManualClock::set(5s);
    std::string text = session.summary();
    expect(text).to_contain("n/a");
    expect(text).not_to_contain("inf");
    expect(text).not_to_contain("nan");
    expect(line_at(text, 4)).to_contain("-5");
}

// ═════════════════════════════════════════════════════════════════════════════
// Report rendering
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Report rendering")

TEST_CASE("single action report matches the expected layout") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "load", 100ms);
    timed_cycle(session, "load", 200ms);
    std::string text = session.summary();

    const std::string header = "Action\t|  Mean duration (s)\t|Num calls      \t|  Total time (s) \t|  Percentage %   \t|";
    const std::string separator(84, '-');
    const std::string expected = "Profiler Report\n\n" + header + "\n" + separator + "\n" +
                                 "Total\t|  -              \t|-              \t|  0.3            \t|  100 %          \t|\n" + separator + "\n" +
                                 "load\t|  0.15           \t|2              \t|  0.3            \t|  100 %          \t|\n";
    expect(text).to_equal(expected);
}

TEST_CASE("empty session renders header and Total row only") {
    ManualClock::set(0s);
    TestSession session;
    ManualClock::advance(1s);
    std::string text;
    expect_no_throw(text = session.summary());
    expect(count_lines(text)).to_equal(6);
    expect(line_at(text, 0)).to_equal("Profiler Report");
    expect(line_at(text, 2)).to_contain("Action");
    expect(line_at(text, 4)).to_contain("Total");
    expect(line_at(text, 4)).to_contain("100 %");
}

TEST_CASE("empty session at its construction instant does not divide by zero") {
    LogCapture capture;
    ManualClock::set(0s);
    TestSession session;
    std::string text = session.summary();
    expect(count_lines(text)).to_equal(6);
    expect(line_at(text, 4)).to_contain("n/a");
}

TEST_CASE("the action column is padded to the longest action name") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "a", 10ms);
    timed_cycle(session, "assemble_matrix", 10ms);
    std::string text = session.summary();
    expect(line_at(text, 2).substr(0, 16)).to_equal("Action         \t");
    expect(line_at(text, 6).substr(0, 16)).to_equal("a              \t");
    expect(line_at(text, 7).substr(0, 16)).to_equal("assemble_matrix\t");
}

TEST_CASE("separators match the header length") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "a_rather_long_action_name", 10ms);
    std::string text = session.summary();
    expect(line_at(text, 3).size()).to_equal(line_at(text, 2).size());
    expect(line_at(text, 5)).to_equal(line_at(text, 3));
    expect(line_at(text, 3).find_first_not_of('-') == std::string::npos).to_be_true();
}

TEST_CASE("one line per completed action") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "parse", 10ms);
    timed_cycle(session, "solve", 30ms);
    timed_cycle(session, "write", 20ms);
    std::string text = session.summary();
    expect(count_lines(text)).to_equal(9);
    expect(line_at(text, 6)).to_contain("solve");
    expect(line_at(text, 7)).to_contain("write");
    expect(line_at(text, 8)).to_contain("parse");
    expect(line_at(text, 6)).to_contain("50 %");
}

TEST_CASE("report options change title and precision") {
    ManualClock::set(0s);
    TestSession session(ReportOptions{.title = "Solver timings", .value_precision = 2, .percentage_precision = 2, .column_width = 10});
    timed_cycle(session, "solve", 1234ms);
    ManualClock::advance(2s);
    std::string text = session.summary();
    expect(line_at(text, 0)).to_equal("Solver timings");
    expect(line_at(text, 6)).to_contain("1.2       ");
    expect(line_at(text, 6)).to_contain("38 %");
}

TEST_CASE("set_options applies to later summaries") {
    TestSession session;
    session.set_options({.title = "Run 2"});
    expect(session.options().title).to_equal("Run 2");
    expect(line_at(session.summary(), 0)).to_equal("Run 2");
}

TEST_CASE("print_summary writes the summary to the stream") {
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "load", 10ms);
    std::ostringstream out;
    session.print_summary(out);
    expect(out.str()).to_equal(session.summary());
}

TEST_CASE("log_summary emits the report through the logger") {
    LogCapture capture;
    ManualClock::set(0s);
    TestSession session;
    timed_cycle(session, "load", 10ms);
    session.log_summary();
    expect(capture.text()).to_contain("[  INFO ]");
    expect(capture.text()).to_contain("Profiler Report");
    expect(capture.text()).to_contain("load\t|");
}
