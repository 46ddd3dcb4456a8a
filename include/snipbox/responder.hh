#pragma once

#include <json/value.h>
#include <snipbox/execution.hh>
#include <string>

namespace snipbox {

struct ExecutionResponse {
    unsigned status; // HTTP status code
    Json::Value body; // {"success": bool, "output": string, "error": string or null}
};

// Success -> 200, Compile/RuntimeFailure -> 400, IoFailure -> 500
ExecutionResponse respond(const ExecutionResult& result);

// Serializes @p value compactly, leaving non-ASCII UTF-8 unescaped
std::string to_json_string(const Json::Value& value);

} // namespace snipbox
