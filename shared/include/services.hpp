#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "collaborators.hpp"

namespace srvkeeper {

class JsonLogger;

// Steam-style build tracking. The installed build comes from the app manifest; the latest build
// is the "buildid" of the "public" branch in the output of the update-check command (for example
// `steamcmd +app_info_print`). Update() runs the update command.
class SteamCmdVersionService : public VersionService {
  public:
    SteamCmdVersionService(std::filesystem::path app_manifest, std::string check_command, std::string update_command,
                           std::chrono::seconds timeout);

    VersionCheck CheckAvailable() override;
    UpdateResult Update() override;

  private:
    std::filesystem::path app_manifest_;
    std::string check_command_;
    std::string update_command_;
    std::chrono::seconds timeout_;
};

// Value of the first `"key" "value"` pair at or after `from` in a Valve KeyValues document.
std::optional<std::string> FindKeyValue(std::string_view document, std::string_view key, std::size_t from = 0);

// Latest public build id in app_info_print output.
std::optional<std::string> ParsePublicBuildId(std::string_view app_info);

// Copies the data directory to `<root>/backup_<YYYYmmdd_HHMMSS>`, optionally turns it into a
// .tar.gz, then prunes the oldest backups beyond `max_backups`.
class DirectoryBackupService : public BackupService {
  public:
    DirectoryBackupService(std::filesystem::path backup_root, int max_backups, bool compress,
                           std::chrono::seconds command_timeout, JsonLogger *journal = nullptr);

    BackupResult Create(const std::filesystem::path &source_path) override;

    // Removes the oldest backup_* entries until at most `max_backups` remain. Returns how many
    // were removed.
    int Prune();

  private:
    std::filesystem::path backup_root_;
    int max_backups_;
    bool compress_;
    std::chrono::seconds command_timeout_;
    JsonLogger *journal_;
};

}  // namespace srvkeeper
