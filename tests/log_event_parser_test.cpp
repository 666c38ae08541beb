#include "log_event_parser.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace {
srvkeeper::TimePoint local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return srvkeeper::Clock::from_time_t(std::mktime(&tm));
}

bool expect_kind(const srvkeeper::LogEventParser &parser, const std::string &line, srvkeeper::StatusKind kind) {
    auto event = parser.Parse(line, srvkeeper::Clock::now());
    if (!event || event->kind != kind) {
        std::cerr << "Unexpected classification for: " << line << "\n";
        return false;
    }
    return true;
}
}

int main() {
    using namespace srvkeeper;
    LogEventParser parser;
    const auto now = local_time(2026, 10, 17, 9, 0, 0);

    auto loading = parser.Parse("[2026-10-17 14:03:22.123] Loading world...", now);
    if (!loading || loading->kind != StatusKind::Loading) {
        std::cerr << "Loading line not recognised\n";
        return 1;
    }
    if (loading->timestamp != local_time(2026, 10, 17, 14, 3, 22) + std::chrono::milliseconds(123)) {
        std::cerr << "ISO timestamp prefix parsed incorrectly\n";
        return 1;
    }

    auto starting = parser.Parse("LOG  : General     , 1729170000> versionNumber=41.78.16 demo=false", now);
    if (!starting || starting->kind != StatusKind::Starting || starting->timestamp != now) {
        std::cerr << "Starting line without timestamp should fall back to now\n";
        return 1;
    }

    auto stats = parser.Parse("[17-10-26 14:05:00.000] Global stats: fps=28.5, min=20, max=31, frametime=35.1, "
                              "players=4, characters=120, zombies=2000, vehicles=15",
                              now);
    if (!stats || stats->kind != StatusKind::Online || !stats->performance) {
        std::cerr << "Stats line should map to Online with a sample\n";
        return 1;
    }
    const auto &sample = *stats->performance;
    if (sample.avg_fps != 28.5 || sample.min_fps != 20.0 || sample.max_fps != 31.0 || sample.frame_time_ms != 35.1 ||
        sample.player_count != 4 || sample.entities.characters != 120 || sample.entities.zombies != 2000 ||
        sample.entities.vehicles != 15) {
        std::cerr << "Performance sample fields incorrect\n";
        return 1;
    }
    if (stats->timestamp != local_time(2026, 10, 17, 14, 5, 0)) {
        std::cerr << "Short timestamp prefix parsed incorrectly\n";
        return 1;
    }

    auto online = parser.Parse("Server started on port 16261", now);
    if (!online || online->kind != StatusKind::Online || online->performance) {
        std::cerr << "Server started marker should be Online without a sample\n";
        return 1;
    }

    if (!expect_kind(parser, "SIGTERM received, saving and quitting", StatusKind::ShuttingDown) ||
        !expect_kind(parser, "[2026-10-17 14:10:00] Shutting down server", StatusKind::ShuttingDown) ||
        !expect_kind(parser, "Server exited with code 0", StatusKind::Offline) ||
        !expect_kind(parser, "shutdown complete", StatusKind::Offline) ||
        !expect_kind(parser, "Initialising world", StatusKind::Loading) ||
        !expect_kind(parser, "[2026-10-17 14:00:00] Starting server", StatusKind::Starting)) {
        return 1;
    }

    if (parser.Parse("", now) || parser.Parse("\r\n", now) || parser.Parse("player chat: hello", now) ||
        parser.Parse(std::string("\xff\xfe\x00 garbage", 11), now)) {
        std::cerr << "Noise lines must be skipped\n";
        return 1;
    }

    if (ParseLogTimestamp("[2026-13-40 99:00:00] bad") || ParseLogTimestamp("no timestamp here")) {
        std::cerr << "Malformed timestamps must be rejected\n";
        return 1;
    }

    auto bare = ParsePerformanceSample("[stats] avgfps=12 players=0");
    if (!bare || bare->avg_fps != 12.0 || bare->min_fps != 12.0 || bare->player_count != 0) {
        std::cerr << "avgfps fallback incorrect\n";
        return 1;
    }
    return 0;
}
