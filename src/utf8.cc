#include <cstdint>
#include <snipbox/utf8.hh>

namespace snipbox {

namespace {

constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

struct SequenceRule {
    size_t length; // 0 for bytes that never start a sequence
    uint8_t second_min; // allowed range of the byte following the lead byte
    uint8_t second_max;
};

constexpr SequenceRule rule_for(uint8_t lead) noexcept {
    if (lead < 0x80) {
        return {1, 0, 0};
    }
    if (lead >= 0xC2 and lead <= 0xDF) {
        return {2, 0x80, 0xBF};
    }
    if (lead == 0xE0) {
        return {3, 0xA0, 0xBF};
    }
    if ((lead >= 0xE1 and lead <= 0xEC) or lead == 0xEE or lead == 0xEF) {
        return {3, 0x80, 0xBF};
    }
    if (lead == 0xED) {
        return {3, 0x80, 0x9F}; // excludes surrogates
    }
    if (lead == 0xF0) {
        return {4, 0x90, 0xBF};
    }
    if (lead >= 0xF1 and lead <= 0xF3) {
        return {4, 0x80, 0xBF};
    }
    if (lead == 0xF4) {
        return {4, 0x80, 0x8F};
    }
    return {0, 0, 0};
}

} // namespace

std::string to_valid_utf8(std::string_view str) {
    std::string res;
    res.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        auto lead = static_cast<uint8_t>(str[i]);
        auto rule = rule_for(lead);
        if (rule.length == 1) {
            res += str[i++];
            continue;
        }
        if (rule.length == 0) {
            res += replacement_character;
            ++i;
            continue;
        }
        // Count how many bytes of the sequence are well-formed
        size_t valid = 1;
        while (valid < rule.length and i + valid < str.size()) {
            auto byte = static_cast<uint8_t>(str[i + valid]);
            auto min = valid == 1 ? rule.second_min : uint8_t{0x80};
            auto max = valid == 1 ? rule.second_max : uint8_t{0xBF};
            if (byte < min or byte > max) {
                break;
            }
            ++valid;
        }
        if (valid == rule.length) {
            res.append(str.substr(i, valid));
        } else {
            res += replacement_character;
        }
        i += valid;
    }
    return res;
}

} // namespace snipbox
