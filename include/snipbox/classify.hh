#pragma once

#include <snipbox/execution.hh>
#include <snipbox/language_profile.hh>
#include <string>
#include <string_view>

namespace snipbox {

// Returns the first compile error marker of @p profile contained in @p stderr_text, or an
// empty string_view if there is none
std::string_view find_compile_error_marker(
    const LanguageProfile& profile, std::string_view stderr_text
) noexcept;

// Classifies a failed execution: CompileFailure if stderr contains a compile error marker,
// RuntimeFailure otherwise. The message is the whole stderr.
ExecutionError classify_failure(const LanguageProfile& profile, std::string stderr_text);

} // namespace snipbox
