#pragma once

/**
 * @file profiler.hxx
 * @brief Named-action profiler: active timers, per-action aggregates, scoped
 *        actions and a ranked summary report
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <exception>
#include <format>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../logger/logger.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Internal helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace profiler_detail {

// Any chrono-style clock whose readings never go backwards.
template <typename C>
concept MonotonicClock = C::is_steady && requires {
    typename C::duration;
    typename C::time_point;
    { C::now() } -> std::same_as<typename C::time_point>;
};

template <typename Duration>
auto to_seconds(Duration dur) -> double {
    return std::chrono::duration_cast<std::chrono::duration<double>>(dur).count();
}

// General (%g-style) notation with `digits` significant digits.
inline auto format_general(double value, int digits) -> std::string { return std::format("{:.{}}", value, digits); }

}  // namespace profiler_detail

using profiler_detail::MonotonicClock;

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

/// Thrown by start() when the action already has a timer in flight.
class DuplicateActionStart : public std::logic_error {
   public:
    explicit DuplicateActionStart(const std::string& action)
        : std::logic_error("Attempted to start '" + action + "' which has already started."), action_(action) {}

    [[nodiscard]] auto action() const -> const std::string& { return action_; }

   private:
    std::string action_;
};

/// Thrown by stop() when the action has no timer in flight.
class UnknownActionStop : public std::logic_error {
   public:
    explicit UnknownActionStop(const std::string& action)
        : std::logic_error("Attempted to stop '" + action + "' which was never started."), action_(action) {}

    [[nodiscard]] auto action() const -> const std::string& { return action_; }

   private:
    std::string action_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Aggregator
// ─────────────────────────────────────────────────────────────────────────────

/** Accumulated duration (seconds) and number of completed start/stop cycles. */
struct AggregateRecord {
    double duration_sum = 0.0;
    std::size_t count = 0;

    [[nodiscard]] auto mean() const -> double { return count == 0 ? 0.0 : duration_sum / static_cast<double>(count); }
};

/**
 * Per-action accumulation of completed timings.
 *
 * Records are created on the first completed cycle of a name and only ever
 * grow. The order in which records were created is kept in a separate
 * sequence, it is the tie-break order of the report.
 */
class Aggregator {
   public:
    void record(const std::string& name, double elapsed) {
        auto [it, inserted] = records_.try_emplace(name);
        if (inserted) {
            order_.push_back(name);
        }
        it->second.duration_sum += elapsed;
        ++it->second.count;
    }

    /// Returns nullptr when no cycle of @p name has completed yet.
    [[nodiscard]] auto find(const std::string& name) const -> const AggregateRecord* {
        auto it = records_.find(name);
        return it == records_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] auto count(const std::string& name) const -> std::size_t {
        const auto* rec = find(name);
        return rec == nullptr ? 0 : rec->count;
    }

    [[nodiscard]] auto duration_sum(const std::string& name) const -> double {
        const auto* rec = find(name);
        return rec == nullptr ? 0.0 : rec->duration_sum;
    }

    [[nodiscard]] auto completion_order() const -> const std::vector<std::string>& { return order_; }
    [[nodiscard]] auto size() const -> std::size_t { return order_.size(); }
    [[nodiscard]] auto empty() const -> bool { return order_.empty(); }

   private:
    std::unordered_map<std::string, AggregateRecord> records_;
    std::vector<std::string> order_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ActiveTimerTable
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Actions currently in flight, keyed by name. At most one timer per name.
 *
 * Thread safety: not thread-safe.
 */
template <MonotonicClock Clock>
class ActiveTimerTable {
   public:
    using time_point = typename Clock::time_point;

    void start(const std::string& name) {
        auto [it, inserted] = started_.try_emplace(name);
        if (!inserted) {
            throw DuplicateActionStart(name);
        }
        it->second = Clock::now();
    }

    /**
     * Stops @p name, feeds the elapsed seconds to @p sink and returns them.
     * The clock is read before the lookup so the lookup is not timed.
     */
    auto stop(const std::string& name, Aggregator& sink) -> double {
        const time_point end_tp = Clock::now();
        auto it = started_.find(name);
        if (it == started_.end()) {
            throw UnknownActionStop(name);
        }
        const double elapsed = profiler_detail::to_seconds(end_tp - it->second);
        started_.erase(it);
        sink.record(name, elapsed);
        return elapsed;
    }

    [[nodiscard]] auto is_active(const std::string& name) const -> bool { return started_.contains(name); }
    [[nodiscard]] auto size() const -> std::size_t { return started_.size(); }
    [[nodiscard]] auto empty() const -> bool { return started_.empty(); }

    /// In-flight names, sorted.
    [[nodiscard]] auto names() const -> std::vector<std::string> {
        std::vector<std::string> result;
        result.reserve(started_.size());
        for (const auto& [name, tp] : started_) {
            result.push_back(name);
        }
        std::sort(result.begin(), result.end());
        return result;
    }

   private:
    std::unordered_map<std::string, time_point> started_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ReportGenerator
// ─────────────────────────────────────────────────────────────────────────────

struct ReportOptions {
    std::string title = "Profiler Report";
    int value_precision = 5;       // significant digits for durations
    int percentage_precision = 3;  // significant digits for percentages
    std::size_t column_width = 15;
};

/** One action in a report. Times in seconds. */
struct ReportRow {
    std::string action;
    double mean;
    std::size_t count;
    double duration_sum;
    std::optional<double> percentage;  // empty when the session duration is not positive
    std::size_t completion_index;
};

struct Report {
    double total_duration = 0.0;
    std::vector<ReportRow> rows;

    [[nodiscard]] auto has_percentages() const -> bool { return total_duration > 0.0; }
};

/**
 * Turns an Aggregator snapshot into a ranked Report and renders it as text.
 *
 * Rows are ranked by descending share of the session duration; equal shares
 * keep completion order. A non-positive session duration yields rows without
 * percentages (rendered "n/a") in completion order.
 */
class ReportGenerator {
   public:
    static constexpr const char* NOT_AVAILABLE = "n/a";

    ReportGenerator() = default;
    explicit ReportGenerator(ReportOptions options) : options_(std::move(options)) {}

    [[nodiscard]] auto options() const -> const ReportOptions& { return options_; }

    [[nodiscard]] auto build(const Aggregator& aggregates, double total_duration) const -> Report {
        Report report;
        report.total_duration = total_duration;
        report.rows.reserve(aggregates.size());

        const auto& order = aggregates.completion_order();
        for (std::size_t i = 0; i < order.size(); ++i) {
            const AggregateRecord* rec = aggregates.find(order[i]);
            std::optional<double> share;
            if (report.has_percentages()) {
                share = 100.0 * rec->duration_sum / total_duration;
            }
            report.rows.push_back({order[i], rec->mean(), rec->count, rec->duration_sum, share, i});
        }

        std::stable_sort(report.rows.begin(), report.rows.end(),
                         [](const ReportRow& lhs, const ReportRow& rhs) { return lhs.percentage.value_or(0.0) > rhs.percentage.value_or(0.0); });
        return report;
    }

    [[nodiscard]] auto render(const Report& report) const -> std::string {
        using profiler_detail::format_general;

        // Width of the Action column. Without rows there are no names to
        // measure and the header label decides.
        std::size_t name_width = 0;
        if (!report.rows.empty()) {
            name_width = std::max_element(report.rows.begin(), report.rows.end(), [](const ReportRow& lhs, const ReportRow& rhs) {
                             return lhs.action.size() < rhs.action.size();
                         })->action.size();
        }

        std::ostringstream out;
        out << options_.title << "\n\n";

        const std::string header = row_("Action", name_width, "Mean duration (s)", "Num calls", "Total time (s)", "Percentage %");
        const std::string separator(header.size(), '-');
        out << header << '\n' << separator << '\n';

        const std::string total_share = report.has_percentages() ? "100 %" : NOT_AVAILABLE;
        out << row_("Total", name_width, "-", "-", format_general(report.total_duration, options_.value_precision), total_share) << '\n';
        out << separator;

        for (const auto& row : report.rows) {
            out << '\n'
                << row_(row.action, name_width, format_general(row.mean, options_.value_precision), std::to_string(row.count),
                        format_general(row.duration_sum, options_.value_precision), share_(row.percentage));
        }
        out << '\n';
        return out.str();
    }

   private:
    [[nodiscard]] auto share_(const std::optional<double>& percentage) const -> std::string {
        if (!percentage) {
            return NOT_AVAILABLE;
        }
        return profiler_detail::format_general(*percentage, options_.percentage_precision) + " %";
    }

    [[nodiscard]] auto row_(const std::string& action, std::size_t name_width, const std::string& mean, const std::string& calls,
                            const std::string& total, const std::string& share) const -> std::string {
        const std::size_t cw = options_.column_width;
        return std::format("{:<{}}\t|  {:<{}}\t|{:<{}}\t|  {:<{}}\t|  {:<{}}\t|", action, name_width, mean, cw, calls, cw, total, cw, share, cw);
    }

    ReportOptions options_;
};

// ─────────────────────────────────────────────────────────────────────────────
// ScopedAction
// ─────────────────────────────────────────────────────────────────────────────

template <MonotonicClock Clock>
class BasicProfileSession;

/**
 * Starts an action on construction and stops it exactly once: on release()
 * or, failing that, on destruction, whichever way the scope is left.
 *
 * The destructor never throws. A stop that fails there is logged: an action
 * already stopped elsewhere at WARNING, any other error at ERROR.
 *
 * Obtained from BasicProfileSession::profile(). Move-only; a moved-from guard
 * does nothing.
 */
template <MonotonicClock Clock>
class BasicScopedAction {
   public:
    BasicScopedAction(BasicProfileSession<Clock>& session, std::string name)
        : session_(&session), name_(std::move(name)), initial_exceptions_(std::uncaught_exceptions()) {
        session_->start(name_);
        active_ = true;
    }

    ~BasicScopedAction() {
        if (!active_) {
            return;
        }
        active_ = false;
        if (std::uncaught_exceptions() > initial_exceptions_) {
            LOG_DEBUG << "action '" << name_ << "' left by an exception";
        }
        try {
            session_->stop(name_);
        } catch (const UnknownActionStop& e) {
            LOG_WARN << "scoped action '" << name_ << "' was already stopped: " << e.what();
        } catch (const std::exception& e) {
            LOG_ERROR << "scoped action '" << name_ << "' could not be recorded: " << e.what();
        }
    }

    BasicScopedAction(const BasicScopedAction&) = delete;
    auto operator=(const BasicScopedAction&) -> BasicScopedAction& = delete;
    BasicScopedAction(BasicScopedAction&& other) noexcept
        : session_(other.session_), name_(std::move(other.name_)), initial_exceptions_(other.initial_exceptions_), active_(other.active_) {
        other.active_ = false;
    }
    auto operator=(BasicScopedAction&&) -> BasicScopedAction& = delete;

    /// Stops the action now and returns its elapsed seconds.
    auto release() -> double {
        if (!active_) {
            throw UnknownActionStop(name_);
        }
        active_ = false;
        return session_->stop(name_);
    }

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto is_active() const -> bool { return active_; }

   private:
    BasicProfileSession<Clock>* session_;
    std::string name_;
    int initial_exceptions_;
    bool active_ = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// ProfileSession
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Owns all timing state of one profiling run: the in-flight timers, the
 * per-action aggregates and the session start time.
 *
 * Usage:
 *   ProfileSession prof;
 *   {
 *       auto scope = prof.profile("load");
 *       load();
 *   }
 *   prof.start("solve");
 *   solve();
 *   prof.stop("solve");
 *   std::cout << prof.summary();
 *
 * Thread safety: not thread-safe. Concurrent start/stop/summary calls on one
 * session need external mutual exclusion; separate sessions are independent.
 */
template <MonotonicClock Clock = std::chrono::steady_clock>
class BasicProfileSession {
   public:
    using clock = Clock;
    using time_point = typename Clock::time_point;
    using scoped_action = BasicScopedAction<Clock>;

    BasicProfileSession() : start_tp_(Clock::now()) {}
    explicit BasicProfileSession(ReportOptions options) : reporter_(std::move(options)), start_tp_(Clock::now()) {}

    BasicProfileSession(const BasicProfileSession&) = delete;
    BasicProfileSession(BasicProfileSession&&) = delete;
    auto operator=(const BasicProfileSession&) -> BasicProfileSession& = delete;
    auto operator=(BasicProfileSession&&) -> BasicProfileSession& = delete;

    // ── Timing ────────────────────────────────────────────────────────────

    /// @throws DuplicateActionStart if @p name is already running.
    void start(const std::string& name) { active_.start(name); }

    /// @throws UnknownActionStop if @p name is not running.
    auto stop(const std::string& name) -> double { return active_.stop(name, aggregates_); }

    /// Starts @p name and returns the guard that stops it.
    [[nodiscard]] auto profile(std::string name) -> scoped_action { return scoped_action(*this, std::move(name)); }

    /// Restarts the session clock used for percentages. Aggregates are kept.
    void reset_start_time() { start_tp_ = Clock::now(); }

    // ── Queries ───────────────────────────────────────────────────────────

    [[nodiscard]] auto is_active(const std::string& name) const -> bool { return active_.is_active(name); }
    [[nodiscard]] auto active_count() const -> std::size_t { return active_.size(); }
    [[nodiscard]] auto count(const std::string& name) const -> std::size_t { return aggregates_.count(name); }
    [[nodiscard]] auto duration_sum(const std::string& name) const -> double { return aggregates_.duration_sum(name); }
    [[nodiscard]] auto aggregates() const -> const Aggregator& { return aggregates_; }
    [[nodiscard]] auto start_time() const -> time_point { return start_tp_; }

    /// Seconds since construction or the last reset_start_time().
    [[nodiscard]] auto session_duration() const -> double { return profiler_detail::to_seconds(Clock::now() - start_tp_); }

    [[nodiscard]] auto options() const -> const ReportOptions& { return reporter_.options(); }
    void set_options(ReportOptions options) { reporter_ = ReportGenerator(std::move(options)); }

    // ── Reporting ─────────────────────────────────────────────────────────

    /**
     * Snapshot of the completed actions ranked by share of the session
     * duration. Actions still in flight are not included.
     */
    [[nodiscard]] auto make_report() const -> Report {
        const double total = session_duration();
        if (!active_.empty()) {
            std::string names;
            for (const auto& name : active_.names()) {
                names += names.empty() ? name : ", " + name;
            }
            LOG_WARN << active_.size() << " action(s) still running, excluded from the report: " << names;
        }
        if (total <= 0.0) {
            LOG_WARN << "session duration is " << total << " s, percentages are not available";
        }
        return reporter_.build(aggregates_, total);
    }

    [[nodiscard]] auto summary() const -> std::string { return reporter_.render(make_report()); }

    void print_summary(std::ostream& ostr = std::cout) const { ostr << summary(); }

    void log_summary(Logger::level lvl = Logger::level::INFO) const { Logger::get_instance().emit("\n" + summary(), lvl); }

   private:
    ActiveTimerTable<Clock> active_;
    Aggregator aggregates_;
    ReportGenerator reporter_;
    time_point start_tp_;
};

using ProfileSession = BasicProfileSession<>;
using ScopedAction = BasicScopedAction<std::chrono::steady_clock>;

// ─────────────────────────────────────────────────────────────────────────────
// Call wrapping
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Invokes @p func with @p args inside a scoped action named @p name.
 * The result, or the exception, of @p func is passed through unchanged.
 */
template <MonotonicClock Clock, typename F, typename... Args>
decltype(auto) profile_call(BasicProfileSession<Clock>& session, std::string name, F&& func, Args&&... args) {
    auto scope = session.profile(std::move(name));
    return std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
}

/**
 * Returns a callable that times every invocation of @p func under @p name.
 * The session must outlive the returned callable.
 *
 *   auto load = wrap(prof, "load", [](const std::string& path) { return read(path); });
 *   auto data = load("input.bin");
 */
template <MonotonicClock Clock, typename F>
auto wrap(BasicProfileSession<Clock>& session, std::string name, F&& func) {
    return [&session, name = std::move(name), func = std::forward<F>(func)](auto&&... args) mutable -> decltype(auto) {
        auto scope = session.profile(name);
        return std::invoke(func, std::forward<decltype(args)>(args)...);
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Call-site instrumentation
// ─────────────────────────────────────────────────────────────────────────────

#define PROFILER_CAT2(a, b) a##b
#define PROFILER_CAT(a, b) PROFILER_CAT2(a, b)

/// Times the rest of the enclosing scope under @p name.
#define PROFILE_SCOPE(session, name) auto PROFILER_CAT(_profile_scope_, __LINE__) = (session).profile(name)

/// Times the rest of the enclosing function under its own name.
#define PROFILE_FUNCTION(session) PROFILE_SCOPE(session, __func__)
