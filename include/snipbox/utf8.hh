#pragma once

#include <string>
#include <string_view>

namespace snipbox {

// Replaces every maximal ill-formed subsequence of @p str with U+FFFD
std::string to_valid_utf8(std::string_view str);

} // namespace snipbox
