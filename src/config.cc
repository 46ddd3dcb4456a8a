#include <charconv>
#include <cstdlib>
#include <snipbox/config.hh>
#include <snipbox/macros/throw.hh>
#include <spdlog/spdlog.h>
#include <system_error>

namespace snipbox {

namespace {

template <class T>
T parse_number(std::string_view name, std::string_view str, T min, T max) {
    T val{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
    if (ec != std::errc{} or ptr != str.data() + str.size() or val < min or val > max) {
        THROW("invalid value of ", name, ": \"", str, "\" (expected a number in range [",
              min, ", ", max, "])");
    }
    return val;
}

} // namespace

Config Config::from(const Lookup& lookup) {
    Config config;
    if (auto val = lookup("HOST")) {
        config.host = *val;
    }
    if (auto val = lookup("PORT")) {
        config.port = parse_number<uint16_t>("PORT", *val, 0, 65535);
    }
    if (auto val = lookup("TEMPLATE_RS")) {
        config.template_rs = *val;
    }
    if (auto val = lookup("TEMPLATE_TS")) {
        config.template_ts = *val;
    }
    if (auto val = lookup("SOLANA_URL")) {
        config.endpoints.http_url = *val;
    }
    if (auto val = lookup("SOLANA_WS_URL")) {
        config.endpoints.ws_url = *val;
    }
    if (auto val = lookup("EXECUTION_TIMEOUT_SECS")) {
        config.execution_timeout =
            std::chrono::seconds{parse_number<int64_t>("EXECUTION_TIMEOUT_SECS", *val, 1, 86400)};
    }
    if (auto val = lookup("MAX_BLOCKING_THREADS")) {
        config.max_blocking_threads =
            parse_number<unsigned>("MAX_BLOCKING_THREADS", *val, 1, 4096);
    }
    if (auto val = lookup("WORKSPACE_MODE")) {
        auto mode = workspace_mode_from_string(*val);
        if (not mode) {
            THROW("invalid value of WORKSPACE_MODE: \"", *val,
                  "\" (expected \"serialize\" or \"isolate\")");
        }
        config.workspace_mode = *mode;
    }
    if (auto val = lookup("MAX_OUTPUT_BYTES")) {
        config.max_output_bytes =
            parse_number<size_t>("MAX_OUTPUT_BYTES", *val, 1, size_t{1} << 30);
    }
    if (auto val = lookup("LOG_LEVEL")) {
        config.log_level = spdlog::level::from_str(*val);
        // from_str() returns off for unknown names
        if (config.log_level == spdlog::level::off and *val != "off") {
            THROW("invalid value of LOG_LEVEL: \"", *val, '"');
        }
    }
    return config;
}

Config Config::from_env() {
    return from([](std::string_view name) -> std::optional<std::string> {
        const char* val = getenv(std::string{name}.c_str());
        if (val == nullptr) {
            return std::nullopt;
        }
        return val;
    });
}

void log_config(const Config& config) {
    spdlog::info("Configuration:");
    spdlog::info("  Host: {}", config.host);
    spdlog::info("  Port: {}", config.port);
    spdlog::info("  Template RS path: {}", config.template_rs.native());
    spdlog::info("  Template TS path: {}", config.template_ts.native());
    spdlog::info("  Solana URL: {}", config.endpoints.http_url);
    spdlog::info("  Solana WS URL: {}", config.endpoints.ws_url);
    spdlog::info("  Execution timeout: {}s", config.execution_timeout.count());
    spdlog::info("  Max blocking threads: {}", config.max_blocking_threads);
    spdlog::info("  Workspace mode: {}", to_string(config.workspace_mode));
    spdlog::info("  Max output bytes: {}", config.max_output_bytes);

    for (const auto& dir : {config.template_rs, config.template_ts}) {
        std::error_code ec;
        if (not std::filesystem::is_directory(dir, ec)) {
            spdlog::warn("Template directory does not exist: {}", dir.native());
        }
    }
}

} // namespace snipbox
