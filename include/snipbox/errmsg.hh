#pragma once

#include <cerrno>
#include <cstring>
#include <string>

// Returns description of errnum in form " - <errno name>: <description>"
inline std::string errmsg(int errnum) {
    const char* name = strerrorname_np(errnum);
    const char* descr = strerrordesc_np(errnum);
    std::string res = " - ";
    if (name) {
        res += name;
    } else {
        res += "errno ";
        res += std::to_string(errnum);
    }
    res += ": ";
    res += descr ? descr : "Unknown error";
    return res;
}

inline std::string errmsg() { return errmsg(errno); }
