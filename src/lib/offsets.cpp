#include "errors.hpp"
#include "text.hpp"
#include "tokenizer.hpp"
#include <algorithm>
#include <iterator>

namespace tokalign {

namespace {

// Greek capital sigma lower-cases to either form depending on its position in
// a word; the two are interchangeable when aligning
char32_t fold_sigma(char32_t c) { return c == U'\u03C2' ? U'\u03C3' : c; }

} // namespace

// Tokens are located one after the other in a normalized copy of the text
// (lower-cased and/or accent-stripped like the sub-tokenizer sees it, without
// NUL, U+FFFD and control codepoints). char_mapping takes each normalized
// codepoint back to the original codepoint it came from.
OffsetList Tokenizer::get_offset_mapping(const std::string &input) const {
    const bool lower = tokenizer_config.do_lower_case;
    const bool strip = tokenizer_config.resolved_strip_accents();

    auto normalize = [lower, strip](std::u32string_view source) {
        std::u32string out;
        for (char32_t c : source) {
            std::u32string ch = lower ? text::lower_case(c) : std::u32string(1, c);
            if (strip) ch = text::strip_accents(ch);
            for (char32_t n : ch) {
                if (n == 0 || n == 0xFFFD || text::is_control(n)) continue;
                out.push_back(n);
            }
        }
        return out;
    };

    const std::string working = lower ? lower_case_protected(input) : input;
    std::vector<Fragment> split_tokens;
    for (auto &fragment : split_and_strip(working)) {
        if (fragment.special) {
            split_tokens.push_back(std::move(fragment));
            continue;
        }
        for (auto &piece :
             model->surface_pieces(fragment.text, vocab.base_vocab())) {
            split_tokens.push_back({std::move(piece), false});
        }
    }

    const std::u32string original = text::to_codepoints(input);
    std::u32string normalized;
    std::vector<size_t> char_mapping;
    for (size_t i = 0; i < original.size(); ++i) {
        const std::u32string ch = normalize(std::u32string_view(&original[i], 1));
        normalized += ch;
        char_mapping.insert(char_mapping.end(), ch.size(), i);
    }

    const std::string &prefix = model->continuation_prefix();
    OffsetList mapping;
    mapping.reserve(split_tokens.size());
    size_t offset = 0;
    for (const auto &token : split_tokens) {
        std::string_view surface = token.text;
        if (!prefix.empty() && surface.substr(0, prefix.size()) == prefix) {
            surface.remove_prefix(prefix.size());
        }
        std::u32string needle = text::to_codepoints(surface);
        if (token.special) needle = normalize(needle);
        if (needle.empty()) {
            throw AlignmentError("cannot align empty token '" + token.text + "'");
        }

        auto hit = std::search(
            normalized.begin() + static_cast<std::ptrdiff_t>(offset),
            normalized.end(), needle.begin(), needle.end(),
            [](char32_t a, char32_t b) { return fold_sigma(a) == fold_sigma(b); });
        if (hit == normalized.end()) {
            throw AlignmentError("token '" + token.text +
                                 "' not found in the normalized text after "
                                 "position " +
                                 std::to_string(offset));
        }
        const auto start = static_cast<size_t>(hit - normalized.begin());
        const size_t end = start + needle.size();
        mapping.emplace_back(char_mapping[start], char_mapping[end - 1] + 1);
        offset = end;
    }
    return mapping;
}

} // namespace tokalign
