#include "dtx/progress/progress_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace dtx::progress {
namespace {

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace

std::optional<std::uint64_t> parse_byte_count(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

ProgressParser::ProgressParser(ParserOptions options)
    : options_(options) {
    reset(std::nullopt, Clock::now());
}

void ProgressParser::reset(std::optional<std::uint64_t> total_bytes, Clock::time_point started_at) {
    total_bytes_ = (total_bytes && *total_bytes > 0) ? total_bytes : std::nullopt;
    started_at_ = started_at;
    pending_.clear();
    discarding_ = false;
    last_bytes_ = 0;
    baseline_bytes_ = 0;
    baseline_time_ = started_at;
    last_instantaneous_ = 0.0;
    window_.clear();
    diagnostics_.clear();
    ignored_lines_ = 0;
}

std::vector<ProgressEvent> ProgressParser::feed(std::string_view chunk, Clock::time_point now) {
    std::vector<ProgressEvent> events;

    while (!chunk.empty()) {
        const auto end = chunk.find_first_of("\r\n");
        const auto piece = chunk.substr(0, end);

        if (!discarding_) {
            if (pending_.size() + piece.size() > options_.max_line_bytes) {
                ++ignored_lines_;
                remember_diagnostic("<overlong meter line discarded>");
                spdlog::debug("Discarding meter line longer than {} bytes", options_.max_line_bytes);
                pending_.clear();
                discarding_ = true;
            } else {
                pending_.append(piece);
            }
        }

        if (end == std::string_view::npos) {
            break;
        }
        if (!discarding_) {
            if (auto event = parse_line(pending_, now)) {
                events.push_back(*event);
            }
        }
        pending_.clear();
        discarding_ = false;
        chunk.remove_prefix(end + 1);
    }
    return events;
}

std::vector<ProgressEvent> ProgressParser::finish(Clock::time_point now) {
    std::vector<ProgressEvent> events;
    discarding_ = false;
    if (!pending_.empty()) {
        const std::string tail = std::move(pending_);
        pending_.clear();
        if (auto event = parse_line(tail, now)) {
            events.push_back(*event);
        }
    }
    return events;
}

std::optional<ProgressEvent> ProgressParser::parse_line(std::string_view line, Clock::time_point now) {
    const auto trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    const auto parsed = parse_byte_count(trimmed);
    if (!parsed) {
        ++ignored_lines_;
        remember_diagnostic(trimmed);
        spdlog::debug("Ignoring non-numeric meter output: '{}'", trimmed);
        return std::nullopt;
    }

    const std::uint64_t bytes = *parsed;
    if (bytes < last_bytes_) {
        spdlog::debug("Dropping meter sample {} below last accepted {}", bytes, last_bytes_);
        return std::nullopt;
    }

    ProgressEvent event;
    event.bytes_transferred = bytes;
    event.timestamp = now;

    const auto since_baseline = now - baseline_time_;
    if (since_baseline < options_.min_sample_interval) {
        // Too close to the previous sample to divide by; keep the last rate
        event.instantaneous_speed = last_instantaneous_;
    } else {
        event.instantaneous_speed =
            static_cast<double>(bytes - baseline_bytes_) / seconds_between(baseline_time_, now);
        baseline_bytes_ = bytes;
        baseline_time_ = now;
        last_instantaneous_ = event.instantaneous_speed;
    }

    const double elapsed = seconds_between(started_at_, now);
    if (now - started_at_ >= options_.min_sample_interval) {
        event.average_speed = static_cast<double>(bytes) / elapsed;
    }

    window_.push_back(SpeedSample{now, bytes - last_bytes_});
    trim_window(now);
    event.smoothed_speed = window_speed(now);

    if (total_bytes_) {
        const double ratio = static_cast<double>(bytes) / static_cast<double>(*total_bytes_);
        event.percent = std::clamp(ratio * 100.0, 0.0, 100.0);
    }

    last_bytes_ = bytes;
    spdlog::trace("Meter sample bytes={} instantaneous={:.0f}B/s", bytes, event.instantaneous_speed);
    return event;
}

void ProgressParser::remember_diagnostic(std::string_view line) {
    if (diagnostics_.size() + line.size() + 1 > options_.max_diagnostic_bytes) {
        return;
    }
    diagnostics_.append(line);
    diagnostics_.push_back('\n');
}

void ProgressParser::trim_window(Clock::time_point now) {
    while (!window_.empty() && now - window_.front().timestamp > options_.speed_window) {
        window_.pop_front();
    }
}

double ProgressParser::window_speed(Clock::time_point now) const {
    const auto span = std::min<Clock::duration>(options_.speed_window, now - started_at_);
    if (span < options_.min_sample_interval) {
        return 0.0;
    }
    std::uint64_t bytes = 0;
    for (const auto& sample : window_) {
        bytes += sample.bytes_since_last;
    }
    return static_cast<double>(bytes) / std::chrono::duration<double>(span).count();
}

} // namespace dtx::progress
