#include "visualize.hpp"
#include "errors.hpp"
#include "text.hpp"

namespace tokalign {

namespace {

std::string colour(TokenId token) {
    unsigned int hash_val = static_cast<unsigned int>(token);
    hash_val ^= hash_val >> 16;
    hash_val *= 0x85ebca6bU;
    hash_val ^= hash_val >> 13;
    hash_val *= 0xc2b2ae35U;
    hash_val ^= hash_val >> 16;
    int r = (hash_val >> 16) & 0xFF;
    int g = (hash_val >> 8) & 0xFF;
    int b = hash_val & 0xFF;
    // Pastel: blend with white
    const double factor = 0.6;
    r = static_cast<int>(r * factor + 255 * (1 - factor));
    g = static_cast<int>(g * factor + 255 * (1 - factor));
    b = static_cast<int>(b * factor + 255 * (1 - factor));
    return "\x1b[48;2;" + std::to_string(r) + ";" + std::to_string(g) + ";" +
           std::to_string(b) + "m\x1b[38;2;0;0;0m";
}

} // namespace

std::string visualize(const std::string &input, const std::vector<TokenId> &ids,
                      const OffsetList &offsets) {
    if (ids.size() != offsets.size()) {
        throw UsageError("visualize: " + std::to_string(ids.size()) +
                         " ids but " + std::to_string(offsets.size()) +
                         " offsets");
    }
    const std::u32string cps = text::to_codepoints(input);
    const std::u32string_view view(cps);

    std::string result;
    size_t pos = 0;
    for (size_t i = 0; i < ids.size(); ++i) {
        const auto [start, end] = offsets[i];
        // Special tokens and padding have no span
        if (start == end || start < pos || end > cps.size()) continue;
        result += text::to_utf8(view.substr(pos, start - pos));
        result += colour(ids[i]);
        result += text::to_utf8(view.substr(start, end - start));
        result += "\x1b[0m";
        pos = end;
    }
    result += text::to_utf8(view.substr(pos));
    return result;
}

} // namespace tokalign
