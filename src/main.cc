#include <exception>
#include <snipbox/config.hh>
#include <snipbox/execution.hh>
#include <snipbox/health.hh>
#include <snipbox/http_server.hh>
#include <snipbox/language_profile.hh>
#include <spdlog/spdlog.h>
#include <vector>

int main() {
    try {
        auto config = snipbox::Config::from_env();
        spdlog::set_level(config.log_level);
        spdlog::info("Starting Solana Playground service");
        snipbox::log_config(config);

        std::vector<snipbox::LanguageProfile> profiles = {
            snipbox::rust_profile(config.template_rs),
            snipbox::typescript_profile(config.template_ts),
        };
        snipbox::Executor executor{{
            .endpoints = config.endpoints,
            .deadline = config.execution_timeout,
            .workspace_mode = config.workspace_mode,
            .max_output_size = config.max_output_bytes,
        }};
        auto health_check = [&profiles] {
            return snipbox::toolchains_healthy(snipbox::check_toolchains(profiles));
        };
        snipbox::http::Router router{profiles, executor, health_check};

        snipbox::http::Server server{config, router};
        server.run();
        spdlog::info("Server stopped");
        return 0;
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }
}
