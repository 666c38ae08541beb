#include "log_event_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <string>
#include <vector>

#include "text.hpp"

namespace srvkeeper {

namespace {

const std::vector<std::string_view> kStatsMarkers = {"global stats", "[stats]"};
const std::vector<std::string_view> kShutdownMarkers = {"sigint", "sigterm", "interrupted",
                                                        "shutting down", "saving and quitting", "quit command"};
const std::vector<std::string_view> kExitMarkers = {"server exited", "process exited", "shutdown complete",
                                                    "exiting"};
const std::vector<std::string_view> kOnlineMarkers = {"server started", "server is ready"};
const std::vector<std::string_view> kLoadingMarkers = {"loading world", "loading map", "world loading",
                                                       "initializing world", "initialising world"};
const std::vector<std::string_view> kStartingMarkers = {"versionnumber=", "starting server", "server starting"};

// Reads exactly `width` digits at `pos`.
bool read_number(std::string_view text, std::size_t pos, std::size_t width, int &value) {
    if (pos + width > text.size()) {
        return false;
    }
    int parsed = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        parsed = parsed * 10 + (text[i] - '0');
    }
    value = parsed;
    return true;
}

bool read_clock(std::string_view text, std::size_t pos, std::tm &tm, int &millis) {
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!read_number(text, pos, 2, hour) || pos + 8 > text.size() || text[pos + 2] != ':' ||
        !read_number(text, pos + 3, 2, minute) || text[pos + 5] != ':' || !read_number(text, pos + 6, 2, second)) {
        return false;
    }
    if (hour > 23 || minute > 59 || second > 60) {
        return false;
    }
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    millis = 0;
    if (pos + 8 < text.size() && text[pos + 8] == '.') {
        read_number(text, pos + 9, 3, millis);
    }
    return true;
}

// "2026-10-17 14:03:22" or "2026-10-17T14:03:22"
bool read_iso_date_time(std::string_view text, std::tm &tm, int &millis) {
    int year = 0;
    int month = 0;
    int day = 0;
    if (!read_number(text, 0, 4, year) || text.size() < 19 || text[4] != '-' || !read_number(text, 5, 2, month) ||
        text[7] != '-' || !read_number(text, 8, 2, day) || (text[10] != ' ' && text[10] != 'T')) {
        return false;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return read_clock(text, 11, tm, millis);
}

// "17-10-26 14:03:22" (day-month-year)
bool read_short_date_time(std::string_view text, std::tm &tm, int &millis) {
    int day = 0;
    int month = 0;
    int year = 0;
    if (!read_number(text, 0, 2, day) || text.size() < 17 || text[2] != '-' || !read_number(text, 3, 2, month) ||
        text[5] != '-' || !read_number(text, 6, 2, year) || text[8] != ' ') {
        return false;
    }
    tm.tm_year = 100 + year;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    return read_clock(text, 9, tm, millis);
}

bool read_double_token(std::string_view lower, std::string_view key, double &value) {
    std::string pattern = std::string(key) + "=";
    std::size_t pos = 0;
    while ((pos = lower.find(pattern, pos)) != std::string_view::npos) {
        // Require a token boundary so "max=" does not match inside "fpsmax=".
        if (pos == 0 || !std::isalnum(static_cast<unsigned char>(lower[pos - 1]))) {
            break;
        }
        pos += pattern.size();
    }
    if (pos == std::string_view::npos) {
        return false;
    }
    const std::size_t start = pos + pattern.size();
    std::size_t end = start;
    while (end < lower.size() && (std::isdigit(static_cast<unsigned char>(lower[end])) || lower[end] == '.' ||
                                  lower[end] == '-')) {
        ++end;
    }
    if (end == start) {
        return false;
    }
    const std::string number(lower.substr(start, end - start));
    char *parsed_end = nullptr;
    const double parsed = std::strtod(number.c_str(), &parsed_end);
    if (parsed_end == number.c_str()) {
        return false;
    }
    value = parsed;
    return true;
}

bool read_int_token(std::string_view lower, std::string_view key, int &value) {
    double parsed = 0.0;
    if (!read_double_token(lower, key, parsed) || parsed < 0.0 || parsed > 1.0e9) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

}  // namespace

std::optional<TimePoint> ParseLogTimestamp(std::string_view line) {
    std::size_t offset = 0;
    while (offset < line.size() && (line[offset] == ' ' || line[offset] == '\t')) {
        ++offset;
    }
    if (offset < line.size() && line[offset] == '[') {
        ++offset;
    }
    std::string_view text = line.substr(offset);

    std::tm tm{};
    int millis = 0;
    if (!read_iso_date_time(text, tm, millis) && !read_short_date_time(text, tm, millis)) {
        return std::nullopt;
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    const std::time_t value = std::mktime(&tm);
    if (value == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(value) + std::chrono::milliseconds(millis);
}

std::optional<PerformanceSample> ParsePerformanceSample(std::string_view line) {
    const std::string lower = ToLower(line);
    PerformanceSample sample;
    if (!read_double_token(lower, "fps", sample.avg_fps) && !read_double_token(lower, "avgfps", sample.avg_fps)) {
        return std::nullopt;
    }
    sample.min_fps = sample.avg_fps;
    sample.max_fps = sample.avg_fps;
    read_double_token(lower, "min", sample.min_fps);
    read_double_token(lower, "max", sample.max_fps);
    if (!read_double_token(lower, "frametime", sample.frame_time_ms)) {
        read_double_token(lower, "frame", sample.frame_time_ms);
    }
    read_int_token(lower, "players", sample.player_count);
    read_int_token(lower, "characters", sample.entities.characters);
    read_int_token(lower, "zombies", sample.entities.zombies);
    read_int_token(lower, "vehicles", sample.entities.vehicles);
    return sample;
}

std::optional<LogEvent> LogEventParser::Parse(std::string_view line, TimePoint now) const {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r' || line.back() == '\0')) {
        line.remove_suffix(1);
    }
    if (line.empty()) {
        return std::nullopt;
    }

    LogEvent event;
    if (ContainsAnyCaseInsensitive(line, kStatsMarkers)) {
        event.kind = StatusKind::Online;
        event.performance = ParsePerformanceSample(line);
    } else if (ContainsAnyCaseInsensitive(line, kShutdownMarkers)) {
        event.kind = StatusKind::ShuttingDown;
    } else if (ContainsAnyCaseInsensitive(line, kExitMarkers)) {
        event.kind = StatusKind::Offline;
    } else if (ContainsAnyCaseInsensitive(line, kOnlineMarkers)) {
        event.kind = StatusKind::Online;
    } else if (ContainsAnyCaseInsensitive(line, kLoadingMarkers)) {
        event.kind = StatusKind::Loading;
    } else if (ContainsAnyCaseInsensitive(line, kStartingMarkers)) {
        event.kind = StatusKind::Starting;
    } else {
        return std::nullopt;
    }

    event.timestamp = ParseLogTimestamp(line).value_or(now);
    event.line = std::string(line);
    return event;
}

}  // namespace srvkeeper
