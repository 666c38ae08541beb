#include "services.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

#include "logger.hpp"
#include "process_runner.hpp"
#include "text.hpp"

namespace srvkeeper {

namespace {

std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return {};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

// Reads the quoted token starting at or after `pos`. Returns npos when there is none.
std::size_t read_quoted(std::string_view text, std::size_t pos, std::string &value) {
    auto open = text.find('"', pos);
    if (open == std::string_view::npos) {
        return std::string_view::npos;
    }
    auto close = text.find('"', open + 1);
    if (close == std::string_view::npos) {
        return std::string_view::npos;
    }
    value.assign(text.substr(open + 1, close - open - 1));
    return close + 1;
}

std::string backup_stamp(TimePoint when) {
    auto time_t_value = Clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&time_t_value, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

}  // namespace

std::optional<std::string> FindKeyValue(std::string_view document, std::string_view key, std::size_t from) {
    const std::string needle = "\"" + std::string(key) + "\"";
    std::size_t pos = from;
    while (true) {
        pos = document.find(needle, pos);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        pos += needle.size();
        auto line_end = document.find('\n', pos);
        auto rest = document.substr(pos, line_end == std::string_view::npos ? std::string_view::npos : line_end - pos);
        std::string value;
        if (read_quoted(rest, 0, value) != std::string_view::npos) {
            return value;
        }
    }
}

std::optional<std::string> ParsePublicBuildId(std::string_view app_info) {
    auto branches = app_info.find("\"branches\"");
    auto pub = app_info.find("\"public\"", branches == std::string_view::npos ? 0 : branches);
    if (pub == std::string_view::npos) {
        return std::nullopt;
    }
    return FindKeyValue(app_info, "buildid", pub);
}

SteamCmdVersionService::SteamCmdVersionService(std::filesystem::path app_manifest, std::string check_command,
                                               std::string update_command, std::chrono::seconds timeout)
    : app_manifest_(std::move(app_manifest)),
      check_command_(std::move(check_command)),
      update_command_(std::move(update_command)),
      timeout_(timeout) {}

VersionCheck SteamCmdVersionService::CheckAvailable() {
    VersionCheck check;
    if (check_command_.empty()) {
        check.error = "no update check command configured";
        return check;
    }
    if (!app_manifest_.empty()) {
        check.installed_build = FindKeyValue(read_file(app_manifest_), "buildid").value_or("");
    }

    auto result = RunShellCommand(check_command_, timeout_);
    if (result.timed_out) {
        check.error = "update check timed out";
        return check;
    }
    if (result.exit_code != 0) {
        check.error = result.error.empty() ? "update check exited with " + std::to_string(result.exit_code)
                                           : result.error;
        return check;
    }
    auto latest = ParsePublicBuildId(result.output);
    if (!latest) {
        check.error = "no public build id in update check output";
        return check;
    }
    check.latest_build = *latest;
    check.available = !check.installed_build.empty() && check.installed_build != check.latest_build;
    return check;
}

UpdateResult SteamCmdVersionService::Update() {
    UpdateResult update;
    if (update_command_.empty()) {
        update.error = "no update command configured";
        return update;
    }
    auto result = RunShellCommand(update_command_, timeout_);
    if (result.timed_out) {
        update.error = "update timed out";
    } else if (result.exit_code != 0) {
        update.error = result.error.empty() ? "update exited with " + std::to_string(result.exit_code) : result.error;
    } else if (ContainsCaseInsensitive(result.output, "ERROR!")) {
        update.error = "updater reported an error";
    } else {
        update.success = true;
    }
    return update;
}

DirectoryBackupService::DirectoryBackupService(std::filesystem::path backup_root, int max_backups, bool compress,
                                               std::chrono::seconds command_timeout, JsonLogger *journal)
    : backup_root_(std::move(backup_root)),
      max_backups_(max_backups),
      compress_(compress),
      command_timeout_(command_timeout),
      journal_(journal) {}

BackupResult DirectoryBackupService::Create(const std::filesystem::path &source_path) {
    BackupResult result;
    std::error_code ec;
    if (!std::filesystem::is_directory(source_path, ec)) {
        result.error = "source " + source_path.string() + " is not a directory";
        return result;
    }
    std::filesystem::create_directories(backup_root_, ec);
    if (ec) {
        result.error = "cannot create " + backup_root_.string() + ": " + ec.message();
        return result;
    }

    const std::string name = "backup_" + backup_stamp(Clock::now());
    const auto target = backup_root_ / name;
    std::filesystem::copy(source_path, target,
                          std::filesystem::copy_options::recursive | std::filesystem::copy_options::copy_symlinks, ec);
    if (ec) {
        result.error = "copy failed: " + ec.message();
        std::filesystem::remove_all(target, ec);
        return result;
    }
    result.location = target;

    if (compress_) {
        auto archive = backup_root_ / (name + ".tar.gz");
        auto tar = RunProcess({"/bin/tar", "-czf", archive.string(), "-C", backup_root_.string(), name},
                              command_timeout_);
        if (tar.ok()) {
            std::filesystem::remove_all(target, ec);
            result.location = archive;
        } else {
            std::filesystem::remove(archive, ec);
            if (journal_) {
                journal_->Log(severity::kWarning, "Backup", "Compression failed; keeping uncompressed copy",
                              {{"path", target.string()}, {"exit_code", std::to_string(tar.exit_code)}});
            }
        }
    }

    result.success = true;
    int removed = Prune();
    if (journal_ && removed > 0) {
        journal_->Log(severity::kInfo, "Backup", "Pruned old backups", {{"removed", std::to_string(removed)}});
    }
    return result;
}

int DirectoryBackupService::Prune() {
    std::vector<std::filesystem::path> backups;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(backup_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind("backup_", 0) == 0) {
            backups.push_back(it->path());
        }
    }
    if (static_cast<int>(backups.size()) <= max_backups_) {
        return 0;
    }
    // The timestamped names sort chronologically.
    std::sort(backups.begin(), backups.end());
    int removed = 0;
    const std::size_t excess = backups.size() - static_cast<std::size_t>(max_backups_);
    for (std::size_t i = 0; i < excess; ++i) {
        std::filesystem::remove_all(backups[i], ec);
        if (!ec) {
            ++removed;
        }
    }
    return removed;
}

}  // namespace srvkeeper
