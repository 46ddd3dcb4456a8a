#pragma once

#include <string>
#include <string_view>

namespace snipbox {

// Addresses of the backing service as seen from the submitted programs
struct Endpoints {
    std::string http_url;
    std::string ws_url;
};

// Loopback endpoints that submitted programs typically hardcode
constexpr std::string_view default_http_endpoints[] = {
    "http://127.0.0.1:8899",
    "http://localhost:8899",
};
constexpr std::string_view default_ws_endpoints[] = {
    "ws://127.0.0.1:8900",
    "ws://localhost:8900",
};

// Replaces every occurrence of the default endpoints in @p source with the configured ones.
// Text is scanned once from left to right, inserted replacements are not scanned again.
std::string rewrite_endpoints(std::string_view source, const Endpoints& endpoints);

} // namespace snipbox
