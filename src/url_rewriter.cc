#include <array>
#include <snipbox/url_rewriter.hh>
#include <utility>

namespace snipbox {

std::string rewrite_endpoints(std::string_view source, const Endpoints& endpoints) {
    using Substitution = std::pair<std::string_view, std::string_view>;
    const std::array<Substitution, 4> substitutions = {{
        Substitution{default_http_endpoints[0], endpoints.http_url},
        Substitution{default_http_endpoints[1], endpoints.http_url},
        Substitution{default_ws_endpoints[0], endpoints.ws_url},
        Substitution{default_ws_endpoints[1], endpoints.ws_url},
    }};

    // Position of the next occurrence of each pattern at or after pos; a pattern is searched
    // again only once pos moves past its cached occurrence, so the text is scanned linearly
    std::array<size_t, 4> next;
    for (size_t i = 0; i < substitutions.size(); ++i) {
        next[i] = source.find(substitutions[i].first);
    }

    std::string res;
    res.reserve(source.size());
    size_t pos = 0;
    for (;;) {
        size_t match = 0;
        for (size_t i = 1; i < substitutions.size(); ++i) {
            if (next[i] < next[match]) {
                match = i;
            }
        }
        if (next[match] == std::string_view::npos) {
            break;
        }
        res.append(source.substr(pos, next[match] - pos));
        res.append(substitutions[match].second);
        pos = next[match] + substitutions[match].first.size();
        for (size_t i = 0; i < substitutions.size(); ++i) {
            if (next[i] < pos) {
                next[i] = source.find(substitutions[i].first, pos);
            }
        }
    }
    if (pos < source.size()) {
        res.append(source.substr(pos));
    }
    return res;
}

} // namespace snipbox
