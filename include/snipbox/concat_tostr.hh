#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace detail {

template <class T>
void append_to(std::string& str, T&& arg) {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, char>) {
        str += arg;
    } else if constexpr (std::is_same_v<U, bool>) {
        str += arg ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<U>) {
        str += std::to_string(arg);
    } else if constexpr (std::is_same_v<U, std::filesystem::path>) {
        str += arg.native();
    } else {
        str += std::string_view{arg};
    }
}

} // namespace detail

template <class... Args>
std::string concat_tostr(Args&&... args) {
    std::string res;
    (detail::append_to(res, std::forward<Args>(args)), ...);
    return res;
}
