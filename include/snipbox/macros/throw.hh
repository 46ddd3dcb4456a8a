#pragma once

#include <snipbox/concat_tostr.hh>
#include <snipbox/macros/stringize.hh>
#include <stdexcept>

// Throws std::runtime_error with message made of the arguments and the throw site
#define THROW(...)                  \
    throw std::runtime_error {      \
        concat_tostr(               \
            __VA_ARGS__,            \
            " (thrown at " __FILE__ \
            ":" SNIPBOX_STRINGIZE(__LINE__) ")")}
