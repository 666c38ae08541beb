#include "process_runner.hpp"
#include "services.hpp"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iostream>

namespace {
using namespace srvkeeper;

const char kManifest[] = R"("AppState"
{
	"appid"		"380870"
	"name"		"Project Zomboid Dedicated Server"
	"buildid"		"15781340"
	"LastOwner"		"0"
}
)";

const char kAppInfo[] = R"("380870"
{
	"depots"
	{
		"branches"
		{
			"public"
			{
				"buildid"		"16043215"
				"timeupdated"		"1729000000"
			}
			"unstable"
			{
				"buildid"		"16100000"
			}
		}
	}
}
)";

bool key_values() {
    if (FindKeyValue(kManifest, "buildid") != std::optional<std::string>("15781340")) {
        std::cerr << "Installed build id not found\n";
        return false;
    }
    if (FindKeyValue(kManifest, "missing")) {
        std::cerr << "Missing key should be empty\n";
        return false;
    }
    if (ParsePublicBuildId(kAppInfo) != std::optional<std::string>("16043215")) {
        std::cerr << "Public build id not found\n";
        return false;
    }
    if (ParsePublicBuildId("no branches here")) {
        std::cerr << "Output without a public branch should not parse\n";
        return false;
    }
    return true;
}

bool process_runner() {
    auto result = RunShellCommand("echo hello; exit 3", std::chrono::seconds(5));
    if (result.exit_code != 3 || result.output != "hello\n" || result.timed_out || result.ok()) {
        std::cerr << "Exit code or output not captured (" << result.exit_code << ")\n";
        return false;
    }
    auto args = RunShellCommand("printf '%s|' \"$@\"", std::chrono::seconds(5), {"admin", "two words"});
    if (!args.ok() || args.output != "admin|two words|") {
        std::cerr << "Positional parameters not passed: " << args.output << "\n";
        return false;
    }
    auto slow = RunShellCommand("sleep 5", std::chrono::seconds(1));
    if (!slow.timed_out || slow.ok()) {
        std::cerr << "Timeout not enforced\n";
        return false;
    }
    auto missing = RunProcess({"/nonexistent/binary"}, std::chrono::seconds(5));
    if (missing.exit_code != 127) {
        std::cerr << "Failed exec should exit 127, got " << missing.exit_code << "\n";
        return false;
    }
    return true;
}

bool backups(const std::filesystem::path &dir) {
    const auto pruned_root = dir / "pruned";
    std::filesystem::create_directories(pruned_root / "backup_20260101_000000");
    std::filesystem::create_directories(pruned_root / "backup_20260102_000000");
    std::filesystem::create_directories(pruned_root / "backup_20260103_000000");
    std::ofstream(pruned_root / "backup_20260104_000000.tar.gz") << "archive";
    std::filesystem::create_directories(pruned_root / "other");

    DirectoryBackupService pruner(pruned_root, 2, false, std::chrono::seconds(30));
    if (pruner.Prune() != 2) {
        std::cerr << "Expected two backups to be pruned\n";
        return false;
    }
    if (std::filesystem::exists(pruned_root / "backup_20260101_000000") ||
        std::filesystem::exists(pruned_root / "backup_20260102_000000") ||
        !std::filesystem::exists(pruned_root / "backup_20260103_000000") ||
        !std::filesystem::exists(pruned_root / "backup_20260104_000000.tar.gz") ||
        !std::filesystem::exists(pruned_root / "other")) {
        std::cerr << "Wrong backups pruned\n";
        return false;
    }

    const auto data = dir / "Saves";
    std::filesystem::create_directories(data / "world");
    std::ofstream(data / "world" / "map.bin") << "tiles";

    DirectoryBackupService service(dir / "backups", 5, false, std::chrono::seconds(30));
    auto result = service.Create(data);
    if (!result.success || !std::filesystem::exists(result.location / "world" / "map.bin") ||
        result.location.filename().string().rfind("backup_", 0) != 0) {
        std::cerr << "Backup copy missing: " << result.error << "\n";
        return false;
    }
    auto missing = service.Create(dir / "nope");
    if (missing.success || missing.error.empty()) {
        std::cerr << "Missing source should fail\n";
        return false;
    }
    return true;
}
}

int main() {
    const auto dir =
        std::filesystem::temp_directory_path() / ("srvkeeper_services_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    bool ok = key_values() && process_runner() && backups(dir);
    std::filesystem::remove_all(dir);
    return ok ? 0 : 1;
}
