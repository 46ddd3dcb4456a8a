#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <snipbox/url_rewriter.hh>
#include <snipbox/workspace.hh>
#include <spdlog/common.h>
#include <string>
#include <string_view>

namespace snipbox {

// Process-wide configuration, read once at startup
struct Config {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    std::filesystem::path template_rs = "/app/template-rs";
    std::filesystem::path template_ts = "/app/template-ts";
    Endpoints endpoints = {
        .http_url = "http://solana-validator:8899",
        .ws_url = "ws://solana-validator:8900",
    };
    std::chrono::seconds execution_timeout{30};
    // Upper bound of threads running submissions and health checks, started on demand
    unsigned max_blocking_threads = 512;
    WorkspaceMode workspace_mode = WorkspaceMode::Serialize;
    size_t max_output_bytes = 8 << 20;
    spdlog::level::level_enum log_level = spdlog::level::info;

    using Lookup = std::function<std::optional<std::string>(std::string_view name)>;

    // Overrides defaults with variables returned by @p lookup; throws std::runtime_error
    // on an invalid value
    static Config from(const Lookup& lookup);

    // Same as from() with the process environment
    static Config from_env();
};

// Logs the configuration and warns about missing workspace directories
void log_config(const Config& config);

} // namespace snipbox
