#pragma once

/**
 * @file logger.hxx
 * @brief Diagnostics logger and macros used by the profiler
 * @version 1.1.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#ifndef _WIN32
#include <unistd.h>
#endif

// ── Internal clock ────────────────────────────────────────────────────────────

namespace logger_detail {
/// Returns seconds elapsed since the first call (program-relative wall time).
inline auto elapsed_seconds() noexcept -> double {
    using clock = std::chrono::steady_clock;
    using dseconds = std::chrono::duration<double>;
    static const auto start = clock::now();
    return std::chrono::duration_cast<dseconds>(clock::now() - start).count();
}

/// Whether the console stream a record goes to (stderr or stdout) is a terminal.
inline auto console_is_tty(bool use_err) -> bool {
#ifdef _WIN32
    return false;
#else
    static const bool out_tty = (isatty(fileno(stdout)) != 0);
    static const bool err_tty = (isatty(fileno(stderr)) != 0);
    return use_err ? err_tty : out_tty;
#endif
}
}  // namespace logger_detail

// ── ANSI color constants ──────────────────────────────────────────────────────

struct Colors {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *blue = "\033[34m";
    static constexpr const char *cyan = "\033[36m";
    static constexpr const char *white = "\033[37m";
    static constexpr const char *bright_red = "\033[91m";
    static constexpr const char *bright_green = "\033[92m";
    static constexpr const char *bright_yellow = "\033[93m";
    static constexpr const char *bright_blue = "\033[94m";
};

// ── Logger ───────────────────────────────────────────────────────────────────

/**
 * @brief Singleton, thread-safe Logger.
 *
 * Supports:
 *  - Runtime-configurable minimum log level.
 *  - stdout/stderr output, an optional log file, or a caller-supplied stream.
 *  - ANSI color codes on terminals.
 *  - Stream-style log_stream objects (RAII flush on destruction).
 *
 * The logger configures itself with LoggerConfig{} defaults on first use, so
 * library code may log before the host program has called configure().
 */
class Logger {
   public:
    // ── Log level ─────────────────────────────────────────────────────────────

    /**
     * @brief Severity levels, ordered from least to most severe.
     *
     * A minimum_level filter checks `incoming_level >= minimum_level`.
     */
    enum class level : int { BASIC = 0, DEBUG = 1, INFO = 2, SUCCESS = 3, WARNING = 4, ERROR = 5 };

    /// Options accepted by configure().
    struct config {
        bool write_to_file = false;
        std::string file_path;
        bool use_colors = true;
        level min_level = level::INFO;
    };

    // ── log_stream ────────────────────────────────────────────────────────────

    /**
     * @brief RAII stream wrapper. Accumulates tokens via `operator<<` and
     *        flushes the full message to the Logger on destruction.
     *
     * @code
     *   LOG_WARN << "action '" << name << "' still running";
     * @endcode
     */
    class log_stream {
       public:
        log_stream(Logger &logger_obj, level lvl) : lg_(logger_obj), level_(lvl) {}

        log_stream(log_stream &&logstr) noexcept : lg_(logstr.lg_), level_(logstr.level_), buf_(std::move(logstr.buf_)) { logstr.moved_ = true; }

        log_stream(const log_stream &) = delete;
        auto operator=(const log_stream &) -> log_stream & = delete;
        auto operator=(log_stream &&) -> log_stream & = delete;

        template <typename T>
        auto operator<<(const T &val) -> log_stream & {
            buf_ << val;
            return *this;
        }

        ~log_stream() {
            if (moved_) {
                return;
            }
            std::string msg = buf_.str();
            if (msg.empty()) {
                return;
            }
            lg_.emit(msg, level_);
        }

       private:
        Logger &lg_;
        level level_;
        std::ostringstream buf_;
        bool moved_ = false;
    };

    // ── Singleton access ──────────────────────────────────────────────────────

    static auto get_instance() -> Logger & {
        static Logger instance;
        return instance;
    }

    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;

    // ── Configuration ─────────────────────────────────────────────────────────

    /**
     * @brief (Re)configure the Logger. May be called at any time.
     *
     * @throws std::runtime_error if the log file cannot be opened.
     */
    void configure(const config &cfg) {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
        if (cfg.write_to_file && !cfg.file_path.empty()) {
            file_.open(cfg.file_path, std::ios::app);
            if (!file_.is_open()) {
                throw std::runtime_error("Failed to open log file: " + cfg.file_path);
            }
        }
        use_colors_ = cfg.use_colors;
        min_level_.store(cfg.min_level, std::memory_order_relaxed);
    }

    /// Raise or lower the minimum level filter at runtime (thread-safe, lock-free).
    void set_min_level(level lvl) { min_level_.store(lvl, std::memory_order_relaxed); }
    [[nodiscard]] auto min_level() const -> level { return min_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Send every record to @p ostr instead of stdout/stderr.
     *
     * Records written to a redirected stream are never colored. Pass nullptr
     * to restore console output. The stream must outlive the redirection.
     */
    void set_stream(std::ostream *ostr) {
        std::lock_guard lock(mutex_);
        stream_ = ostr;
    }

    // ── Stream-style factory methods ─────────────────────────────────────────

    log_stream log() { return {*this, level::BASIC}; }
    log_stream debug() { return {*this, level::DEBUG}; }
    log_stream info() { return {*this, level::INFO}; }
    log_stream warning() { return {*this, level::WARNING}; }
    log_stream error() { return {*this, level::ERROR}; }

    /// Emit @p message at @p lvl. Messages below the minimum level are dropped.
    void emit(const std::string &message, level lvl) {
        if (lvl < min_level_.load(std::memory_order_relaxed)) {
            return;
        }
        const double elapsed = logger_detail::elapsed_seconds();
        std::lock_guard lock(mutex_);
        write_record(message, lvl, elapsed);
    }

    ~Logger() {
        std::lock_guard lock(mutex_);
        if (file_.is_open()) {
            file_.close();
        }
    }

    // ── Formatting helpers ────────────────────────────────────────────────────

    /// Fixed-width level tag, e.g. "WARNING" or "  INFO ".
    static auto label_of(level lvl) noexcept -> const char * { return meta_of(lvl).label; }

    /// Formats program-relative seconds as hh:mm:ss.mmm.
    static auto format_time(double elapsed) -> std::string {
        constexpr int MS_PER_SECOND = 1000;
        constexpr int MS_PER_MINUTE = 60000;
        constexpr int MS_PER_HOUR = 3600000;
        constexpr int TIME_BUFFER_SIZE = 32;

        int total_ms = static_cast<int>(elapsed * MS_PER_SECOND);
        int hours = total_ms / MS_PER_HOUR;
        int minutes = (total_ms % MS_PER_HOUR) / MS_PER_MINUTE;
        int seconds = (total_ms % MS_PER_MINUTE) / MS_PER_SECOND;
        int millis = total_ms % MS_PER_SECOND;

        char buf[TIME_BUFFER_SIZE];
        std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", hours, minutes, seconds, millis);
        return buf;
    }

   private:
    Logger() = default;

    struct level_meta {
        const char *label;  // fixed-width, 7 chars
        const char *color;
        bool use_err;  // route to stderr?
    };

    static auto meta_of(level lvl) noexcept -> level_meta {
        switch (lvl) {
            case level::BASIC:
                return {.label = "       ", .color = Colors::white, .use_err = false};
            case level::DEBUG:
                return {.label = " DEBUG ", .color = Colors::blue, .use_err = false};
            case level::INFO:
                return {.label = "  INFO ", .color = Colors::bright_blue, .use_err = false};
            case level::SUCCESS:
                return {.label = "SUCCESS", .color = Colors::bright_green, .use_err = false};
            case level::WARNING:
                return {.label = "WARNING", .color = Colors::bright_yellow, .use_err = true};
            case level::ERROR:
                return {.label = " ERROR ", .color = Colors::bright_red, .use_err = true};
        }
        return {.label = "       ", .color = Colors::white, .use_err = false};
    }

    // Called with mutex_ held.
    void write_record(const std::string &message, level lvl, double elapsed) {
        const auto [label, color, use_err] = meta_of(lvl);

        std::string time_tag = "[" + format_time(elapsed) + "] ";
        std::string level_tag = lvl == level::BASIC ? "" : std::string("[") + label + "] ";

        if (file_.is_open()) {
            file_ << time_tag << level_tag << message << '\n';
            file_.flush();
            return;
        }
        if (stream_ != nullptr) {
            *stream_ << time_tag << level_tag << message << '\n';
            return;
        }

        std::ostream &ostr = use_err ? std::cerr : std::cout;
        if (use_colors_ && logger_detail::console_is_tty(use_err)) {
            ostr << Colors::cyan << time_tag << Colors::reset << color << level_tag << Colors::reset << message << '\n';
        } else {
            ostr << time_tag << level_tag << message << '\n';
        }
    }

    mutable std::mutex mutex_;
    bool use_colors_ = true;
    std::atomic<level> min_level_{level::INFO};
    std::ostream *stream_ = nullptr;
    std::ofstream file_;
};

using LoggerConfig = Logger::config;

// ── Convenience functions and macros ─────────────────────────────────────────

/// Restore default settings (console, colors, INFO and above).
inline void log_init() { Logger::get_instance().configure({}); }

// Stream-style logging macros
#define LOG Logger::get_instance().log()
#define LOG_DEBUG Logger::get_instance().debug()
#define LOG_INFO Logger::get_instance().info()
#define LOG_WARN Logger::get_instance().warning()
#define LOG_ERROR Logger::get_instance().error()
