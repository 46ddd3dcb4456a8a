#include <algorithm>
#include <snipbox/health.hh>
#include <snipbox/subprocess.hh>
#include <spdlog/spdlog.h>

namespace snipbox {

std::vector<ToolchainStatus>
check_toolchains(const std::vector<LanguageProfile>& profiles, std::chrono::seconds deadline) {
    std::vector<ToolchainStatus> statuses;
    statuses.reserve(profiles.size());
    for (const auto& profile : profiles) {
        bool available = false;
        try {
            auto res = subprocess::run({
                .executable = profile.version_command.at(0),
                .args = profile.version_command,
                .working_dir = {},
                .deadline = deadline,
                .max_output_size = 4096,
            });
            available = not res.timed_out and res.exited_successfully();
        } catch (const std::exception& e) {
            spdlog::debug("{}: version check failed: {}", profile.name, e.what());
        }
        statuses.push_back({.name = profile.name, .available = available});
    }
    return statuses;
}

bool toolchains_healthy(const std::vector<ToolchainStatus>& statuses) {
    bool healthy = std::all_of(statuses.begin(), statuses.end(), [](const auto& status) {
        return status.available;
    });
    if (healthy) {
        spdlog::info("Health check succeeded - all toolchains available");
        return true;
    }
    for (const auto& status : statuses) {
        spdlog::warn(
            "Health check: {} toolchain {}", status.name,
            status.available ? "available" : "unavailable"
        );
    }
    return false;
}

} // namespace snipbox
