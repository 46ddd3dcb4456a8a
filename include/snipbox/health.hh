#pragma once

#include <chrono>
#include <snipbox/language_profile.hh>
#include <string>
#include <vector>

namespace snipbox {

struct ToolchainStatus {
    std::string name; // name of the language profile
    bool available;
};

// Runs the version command of every profile; a command that cannot be spawned, fails, or exceeds
// @p deadline marks its toolchain unavailable
std::vector<ToolchainStatus> check_toolchains(
    const std::vector<LanguageProfile>& profiles,
    std::chrono::seconds deadline = std::chrono::seconds{10}
);

// Returns true iff every toolchain is available; logs the outcome
bool toolchains_healthy(const std::vector<ToolchainStatus>& statuses);

} // namespace snipbox
