#include "log_tail_reader.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
using namespace srvkeeper;
using Lines = std::vector<std::string>;

void write_file(const std::filesystem::path &path, const std::string &text, bool append) {
    std::ofstream out(path, append ? std::ios::binary | std::ios::app : std::ios::binary | std::ios::trunc);
    out << text;
}

bool expect(const Lines &actual, const Lines &expected, const char *what) {
    if (actual != expected) {
        std::cerr << what << ": got " << actual.size() << " lines";
        for (const auto &line : actual) {
            std::cerr << " [" << line << "]";
        }
        std::cerr << "\n";
        return false;
    }
    return true;
}

bool follows_appends_and_truncation(const std::filesystem::path &dir) {
    const auto log = dir / "console.txt";
    write_file(log, "line1\nline2\npartial", false);

    LogTailReader reader(log, 3);
    if (!expect(reader.RecentTail(10), {"line1", "line2"}, "initial tail") ||
        !expect(reader.ReadNewLines(), {}, "existing output is not new")) {
        return false;
    }

    write_file(log, " end\nline3\n", true);
    if (!expect(reader.ReadNewLines(), {"partial end", "line3"}, "appended lines")) {
        return false;
    }
    write_file(log, "windows\r\nhalf", true);
    if (!expect(reader.ReadNewLines(), {"windows"}, "carriage return stripped")) {
        return false;
    }
    if (!expect(reader.RecentTail(10), {"partial end", "line3", "windows"}, "tail is bounded")) {
        return false;
    }

    write_file(log, "fresh\n", false);
    if (!expect(reader.ReadNewLines(), {"fresh"}, "truncated file restarts") || reader.Offset() != 6) {
        return false;
    }

    const auto rotated = dir / "console.next";
    write_file(rotated, "rotated\n", false);
    std::filesystem::rename(rotated, log);
    return expect(reader.ReadNewLines(), {"rotated"}, "replaced file restarts");
}

bool waits_for_missing_file(const std::filesystem::path &dir) {
    const auto log = dir / "later.txt";
    LogTailReader reader(log, 10);
    if (!expect(reader.ReadNewLines(), {}, "missing file") || !reader.RecentTail(5).empty()) {
        return false;
    }
    write_file(log, "hello\n", false);
    return expect(reader.ReadNewLines(), {"hello"}, "file created later");
}
}

int main() {
    const auto dir = std::filesystem::temp_directory_path() / ("srvkeeper_tail_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    bool ok = follows_appends_and_truncation(dir) && waits_for_missing_file(dir);
    std::filesystem::remove_all(dir);
    return ok ? 0 : 1;
}
