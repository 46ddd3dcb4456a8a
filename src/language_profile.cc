#include <snipbox/language_profile.hh>

namespace snipbox {

LanguageProfile rust_profile(std::filesystem::path workspace_root) {
    return {
        .name = "rust",
        .route = "/rust",
        .workspace_root = std::move(workspace_root),
        .source_file = "src/main.rs",
        .command = {"cargo", "run", "--verbose"},
        .compile_error_markers =
            {
                "error[E",
                "could not compile",
                "error: aborting due to",
            },
        .version_command = {"cargo", "--version"},
        // target/ holds the pre-built dependencies and is rewritten by every build
        .workspace_mode = WorkspaceMode::Serialize,
        .linked_entries = {},
    };
}

LanguageProfile typescript_profile(std::filesystem::path workspace_root) {
    return {
        .name = "typescript",
        .route = "/typescript",
        .workspace_root = std::move(workspace_root),
        .source_file = "src/index.ts",
        // --silent keeps the script banner of pnpm out of the program output
        .command = {"pnpm", "--silent", "run", "start"},
        .compile_error_markers =
            {
                "TypeScript error",
                "TypeError",
                "SyntaxError",
            },
        .version_command = {"pnpm", "--version"},
        .workspace_mode = std::nullopt,
        .linked_entries = {"node_modules"},
    };
}

} // namespace snipbox
