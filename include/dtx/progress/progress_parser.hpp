#pragma once

/**
 * @file progress_parser.hpp
 * @brief Turns the metering filter's byte counter into progress events
 *
 * WHY THIS FILE EXISTS:
 * `pv -n -b` prints one cumulative byte count per line on its stderr. The
 * presentation layer wants percentage and speed, not raw counters, and must
 * never see the counter go backwards.
 *
 * WHAT IT DOES:
 * - Reassembles lines from arbitrarily split chunks
 * - Ignores (and remembers) anything that is not a plain integer
 * - Drops samples lower than the last accepted one
 * - Computes percent, instantaneous, average and windowed speed
 *
 * EXAMPLE:
 * ProgressParser parser;
 * parser.reset(1'000'000, start);
 * for (auto& event : parser.feed("250000\n500", now)) { ... }   // one event
 * for (auto& event : parser.feed("000\n", later)) { ... }        // one event
 */

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dtx::progress {

using Clock = std::chrono::steady_clock;

struct ProgressEvent {
    std::uint64_t bytes_transferred = 0;
    std::optional<double> percent;        ///< [0, 100]; absent when the total is unknown
    double instantaneous_speed = 0.0;     ///< bytes/s since the previous sample
    double average_speed = 0.0;           ///< bytes/s since the transfer started
    double smoothed_speed = 0.0;          ///< bytes/s over the speed window
    Clock::time_point timestamp{};
};

struct SpeedSample {
    Clock::time_point timestamp{};
    std::uint64_t bytes_since_last = 0;
};

struct ParserOptions {
    std::chrono::milliseconds speed_window{5000};
    std::chrono::microseconds min_sample_interval{1000};
    std::size_t max_diagnostic_bytes = 16 * 1024;
    std::size_t max_line_bytes = 4096;   ///< Longer lines are discarded up to their newline
};

class ProgressParser {
public:
    explicit ProgressParser(ParserOptions options = {});

    /**
     * @brief Start a new sequence; total of 0 or nullopt disables percent
     */
    void reset(std::optional<std::uint64_t> total_bytes, Clock::time_point started_at);

    /**
     * @brief Consume a raw chunk; returns the events for every complete line
     *
     * Memory stays bounded by max_line_bytes whatever the meter prints: an
     * overlong line counts as one ignored line and is skipped to its newline.
     */
    std::vector<ProgressEvent> feed(std::string_view chunk, Clock::time_point now);

    /**
     * @brief Flush a trailing line that had no newline (end of stream)
     */
    std::vector<ProgressEvent> finish(Clock::time_point now);

    /**
     * @brief Parse one line; nullopt when ignored (malformed, or went backwards)
     */
    std::optional<ProgressEvent> parse_line(std::string_view line, Clock::time_point now);

    std::uint64_t bytes_transferred() const noexcept { return last_bytes_; }
    std::optional<std::uint64_t> total_bytes() const noexcept { return total_bytes_; }
    std::size_t ignored_lines() const noexcept { return ignored_lines_; }

    /**
     * @brief Non-numeric lines seen so far (pv reports its own errors here)
     */
    const std::string& diagnostics() const noexcept { return diagnostics_; }

    const std::deque<SpeedSample>& speed_samples() const noexcept { return window_; }

private:
    void remember_diagnostic(std::string_view line);
    void trim_window(Clock::time_point now);
    double window_speed(Clock::time_point now) const;

    ParserOptions options_;
    std::optional<std::uint64_t> total_bytes_;
    Clock::time_point started_at_{};

    std::string pending_;              ///< Partial line carried between chunks
    bool discarding_ = false;          ///< Inside an overlong line
    std::uint64_t last_bytes_ = 0;     ///< Highest accepted sample
    std::uint64_t baseline_bytes_ = 0; ///< Reference for instantaneous speed
    Clock::time_point baseline_time_{};
    double last_instantaneous_ = 0.0;

    std::deque<SpeedSample> window_;
    std::string diagnostics_;
    std::size_t ignored_lines_ = 0;
};

/**
 * @brief Parse a plain unsigned decimal (surrounding whitespace allowed)
 */
std::optional<std::uint64_t> parse_byte_count(std::string_view text);

} // namespace dtx::progress
