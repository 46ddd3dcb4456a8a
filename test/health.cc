#include <gtest/gtest.h>
#include <snipbox/health.hh>

using namespace std::chrono_literals;
using snipbox::LanguageProfile;
using snipbox::check_toolchains;
using snipbox::toolchains_healthy;

namespace {

LanguageProfile with_version_command(std::string name, std::vector<std::string> version_command) {
    auto profile = snipbox::rust_profile("/nonexistent");
    profile.name = std::move(name);
    profile.version_command = std::move(version_command);
    return profile;
}

} // namespace

// NOLINTNEXTLINE
TEST(check_toolchains, available_toolchains) {
    auto statuses = check_toolchains({
        with_version_command("first", {"sh", "-c", "echo 'tool 1.0.0'"}),
        with_version_command("second", {"true"}),
    });
    ASSERT_EQ(statuses.size(), 2U);
    ASSERT_EQ(statuses[0].name, "first");
    ASSERT_TRUE(statuses[0].available);
    ASSERT_EQ(statuses[1].name, "second");
    ASSERT_TRUE(statuses[1].available);
    ASSERT_TRUE(toolchains_healthy(statuses));
}

// NOLINTNEXTLINE
TEST(check_toolchains, missing_toolchain) {
    auto statuses = check_toolchains({
        with_version_command("present", {"true"}),
        with_version_command("missing", {"snipbox-no-such-toolchain", "--version"}),
    });
    ASSERT_TRUE(statuses[0].available);
    ASSERT_FALSE(statuses[1].available);
    ASSERT_FALSE(toolchains_healthy(statuses));
}

// NOLINTNEXTLINE
TEST(check_toolchains, failing_toolchain) {
    auto statuses = check_toolchains({with_version_command("broken", {"sh", "-c", "exit 1"})});
    ASSERT_FALSE(statuses[0].available);
}

// NOLINTNEXTLINE
TEST(check_toolchains, hanging_toolchain) {
    auto start = std::chrono::steady_clock::now();
    auto statuses = check_toolchains({with_version_command("hanging", {"sleep", "30"})}, 1s);
    ASSERT_LT(std::chrono::steady_clock::now() - start, 10s);
    ASSERT_FALSE(statuses[0].available);
}

// NOLINTNEXTLINE
TEST(toolchains_healthy, no_toolchains) { ASSERT_TRUE(toolchains_healthy({})); }

// NOLINTNEXTLINE
TEST(language_profiles, routes_and_commands) {
    auto rust = snipbox::rust_profile("/app/template-rs");
    ASSERT_EQ(rust.route, "/rust");
    ASSERT_EQ(rust.source_file.native(), "src/main.rs");
    ASSERT_EQ(rust.command, (std::vector<std::string>{"cargo", "run", "--verbose"}));
    // Copying target/ per request is not practical
    ASSERT_TRUE(rust.workspace_mode == snipbox::WorkspaceMode::Serialize);

    auto typescript = snipbox::typescript_profile("/app/template-ts");
    ASSERT_EQ(typescript.route, "/typescript");
    ASSERT_EQ(typescript.source_file.native(), "src/index.ts");
    ASSERT_EQ(typescript.command.front(), "pnpm");
    ASSERT_EQ(typescript.command.back(), "start");
    ASSERT_FALSE(typescript.workspace_mode.has_value());
    ASSERT_EQ(typescript.linked_entries, (std::vector<std::string>{"node_modules"}));
}
