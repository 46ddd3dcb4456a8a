#include <snipbox/classify.hh>

namespace snipbox {

std::string_view find_compile_error_marker(
    const LanguageProfile& profile, std::string_view stderr_text
) noexcept {
    for (const auto& marker : profile.compile_error_markers) {
        if (stderr_text.find(marker) != std::string_view::npos) {
            return marker;
        }
    }
    return {};
}

ExecutionError classify_failure(const LanguageProfile& profile, std::string stderr_text) {
    if (not find_compile_error_marker(profile, stderr_text).empty()) {
        return {.kind = ExecutionError::Kind::CompileFailure, .message = std::move(stderr_text)};
    }
    return {.kind = ExecutionError::Kind::RuntimeFailure, .message = std::move(stderr_text)};
}

} // namespace snipbox
