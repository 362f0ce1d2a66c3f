#include "text.hpp"
#include <stdexcept>
#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf16.h>
#include <unicode/utf8.h>

namespace tokalign::text {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

struct Range {
    char32_t first;
    char32_t last;
};

bool in_ranges(char32_t cp, const Range *ranges, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        if (cp >= ranges[i].first && cp <= ranges[i].last) return true;
    }
    return false;
}

constexpr Range kCjkRanges[] = {
    {0x4E00, 0x9FFF},   {0x3400, 0x4DBF},   {0x20000, 0x2A6DF},
    {0x2A700, 0x2B73F}, {0x2B740, 0x2B81F}, {0x2B820, 0x2CEAF},
    {0xF900, 0xFAFF},   {0x2F800, 0x2FA1F},
};

// Rewritten to their NFKC expansion by normalize()
constexpr Range kNonNormalizedRanges[] = {
    {0xFF00, 0xFFEF}, // Halfwidth and Fullwidth Forms
    {0xFE50, 0xFE6B}, // Small Form Variants
    {0x3358, 0x33FF}, // CJK Compatibility
    {0x249C, 0x24E9}, // Enclosed Alphanumerics: parenthesized/circled letters
    {0x3200, 0x32FF}, // Enclosed CJK Letters and Months
};

// Rewritten to " <value> " by normalize()
constexpr Range kNonNormalizedNumericRanges[] = {
    {0x2460, 0x249B},
    {0x24EA, 0x24FF},
    {0x2776, 0x2793}, // Dingbat circled digits
    {0x2160, 0x217F}, // Number Forms: roman numerals
};

// Single-codepoint substitutions some vocabularies depend on
struct Substitution {
    char32_t from;
    char32_t to;
};
constexpr Substitution kSubstitutions[] = {
    {0xF979, 0x51C9}, // CJK compatibility ideograph -> 凉
};

constexpr char32_t kLegacySymbols[] = {0x00AD, 0x00B2, 0x00BA, 0x3007,
                                       0x00B5, 0x00D8, 0x014B, 0x01B1};

// Script blocks that get surrounded by spaces
constexpr Range kSpacedScriptRanges[] = {
    {0x3040, 0x30FF}, // Hiragana and Katakana
    {0x0370, 0x04FF}, // Greek/Coptic and Cyrillic
    {0x0250, 0x02AF}, // IPA extensions
};

template <size_t N> constexpr size_t count_of(const Range (&)[N]) { return N; }

uint32_t category_mask(char32_t c) {
    return U_GET_GC_MASK(static_cast<UChar32>(c));
}

const icu::Normalizer2 *nfkc() {
    static const icu::Normalizer2 *instance = [] {
        UErrorCode status = U_ZERO_ERROR;
        const icu::Normalizer2 *n = icu::Normalizer2::getNFKCInstance(status);
        if (U_FAILURE(status)) {
            throw std::runtime_error(std::string("ICU NFKC unavailable: ") +
                                     u_errorName(status));
        }
        return n;
    }();
    return instance;
}

const icu::Normalizer2 *nfd() {
    static const icu::Normalizer2 *instance = [] {
        UErrorCode status = U_ZERO_ERROR;
        const icu::Normalizer2 *n = icu::Normalizer2::getNFDInstance(status);
        if (U_FAILURE(status)) {
            throw std::runtime_error(std::string("ICU NFD unavailable: ") +
                                     u_errorName(status));
        }
        return n;
    }();
    return instance;
}

std::u32string from_unicode_string(const icu::UnicodeString &s) {
    std::u32string out;
    out.reserve(s.length());
    for (int32_t i = 0; i < s.length();) {
        UChar32 c = s.char32At(i);
        out.push_back(static_cast<char32_t>(c));
        i += U16_LENGTH(c);
    }
    return out;
}

icu::UnicodeString to_unicode_string(std::u32string_view cps) {
    icu::UnicodeString s;
    for (char32_t c : cps) {
        s.append(static_cast<UChar32>(c));
    }
    return s;
}

std::u32string normalize_with(const icu::Normalizer2 *normalizer,
                              std::u32string_view cps) {
    UErrorCode status = U_ZERO_ERROR;
    icu::UnicodeString out =
        normalizer->normalize(to_unicode_string(cps), status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("ICU normalization failed: ") +
                                 u_errorName(status));
    }
    return from_unicode_string(out);
}

} // namespace

std::u32string to_codepoints(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    const auto *s = reinterpret_cast<const uint8_t *>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT_OR_FFFD(s, i, length, c);
        out.push_back(static_cast<char32_t>(c));
    }
    return out;
}

std::string to_utf8(char32_t codepoint) {
    if (codepoint > 0x10FFFF || (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        codepoint = kReplacementChar;
    }
    char buf[U8_MAX_LENGTH];
    int32_t n = 0;
    U8_APPEND_UNSAFE(buf, n, static_cast<UChar32>(codepoint));
    return std::string(buf, static_cast<size_t>(n));
}

std::string to_utf8(std::u32string_view codepoints) {
    std::string out;
    out.reserve(codepoints.size());
    for (char32_t c : codepoints) {
        out += to_utf8(c);
    }
    return out;
}

bool is_whitespace(char32_t c) {
    if (c == U' ' || c == U'\t' || c == U'\n' || c == U'\r') return true;
    return (category_mask(c) & U_GC_ZS_MASK) != 0;
}

bool is_control(char32_t c) {
    if (c == U'\t' || c == U'\n' || c == U'\r') return false;
    return (category_mask(c) & U_GC_C_MASK) != 0;
}

bool is_punctuation(char32_t c) {
    if ((c >= 33 && c <= 47) || (c >= 58 && c <= 64) || (c >= 91 && c <= 96) ||
        (c >= 123 && c <= 126)) {
        return true;
    }
    return (category_mask(c) & U_GC_P_MASK) != 0;
}

bool is_symbol(char32_t c) {
    if ((category_mask(c) & U_GC_S_MASK) != 0) return true;
    for (char32_t legacy : kLegacySymbols) {
        if (c == legacy) return true;
    }
    return false;
}

bool is_cjk(char32_t cp) {
    return in_ranges(cp, kCjkRanges, count_of(kCjkRanges));
}

bool is_start_of_word(std::string_view text) {
    if (text.empty()) return false;
    std::u32string cps = to_codepoints(text);
    char32_t first = cps.front();
    return is_control(first) || is_punctuation(first) || is_whitespace(first);
}

bool is_end_of_word(std::string_view text) {
    if (text.empty()) return false;
    std::u32string cps = to_codepoints(text);
    char32_t last = cps.back();
    return is_control(last) || is_punctuation(last) || is_whitespace(last);
}

std::vector<std::string> split_on_cjk(std::string_view text) {
    std::vector<std::string> fragments;
    std::u32string buffer;
    for (char32_t c : to_codepoints(text)) {
        if (is_cjk(c)) {
            if (!buffer.empty()) {
                fragments.push_back(to_utf8(buffer));
                buffer.clear();
            }
            fragments.push_back(to_utf8(c));
        } else {
            buffer.push_back(c);
        }
    }
    if (!buffer.empty()) {
        fragments.push_back(to_utf8(buffer));
    }
    return fragments;
}

std::string insert_spaces_around_scripts(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t c : to_codepoints(text)) {
        if (in_ranges(c, kSpacedScriptRanges, count_of(kSpacedScriptRanges)) ||
            is_symbol(c)) {
            out += ' ';
            out += to_utf8(c);
            out += ' ';
        } else {
            out += to_utf8(c);
        }
    }
    return out;
}

std::string normalize(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    for (char32_t c : to_codepoints(text)) {
        if (in_ranges(c, kNonNormalizedRanges, count_of(kNonNormalizedRanges))) {
            out += normalize_with(nfkc(), std::u32string(1, c));
            continue;
        }
        if (in_ranges(c, kNonNormalizedNumericRanges,
                      count_of(kNonNormalizedNumericRanges))) {
            double value = u_getNumericValue(static_cast<UChar32>(c));
            if (value != U_NO_NUMERIC_VALUE) {
                std::string digits =
                    std::to_string(static_cast<long long>(value));
                out += U' ';
                out += to_codepoints(digits);
                out += U' ';
                continue;
            }
        }
        bool substituted = false;
        for (const auto &sub : kSubstitutions) {
            if (c == sub.from) {
                out += sub.to;
                substituted = true;
                break;
            }
        }
        if (!substituted) out += c;
    }
    return to_utf8(out);
}

std::u32string lower_case(char32_t c) {
    icu::UnicodeString s(static_cast<UChar32>(c));
    s.toLower(icu::Locale::getRoot());
    return from_unicode_string(s);
}

std::string lower_case(std::string_view text) {
    icu::UnicodeString s = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    s.toLower(icu::Locale::getRoot());
    std::string out;
    s.toUTF8String(out);
    return out;
}

std::u32string strip_accents(std::u32string_view text) {
    std::u32string decomposed = normalize_with(nfd(), text);
    std::u32string out;
    out.reserve(decomposed.size());
    for (char32_t c : decomposed) {
        if ((category_mask(c) & U_GC_MN_MASK) == 0) out.push_back(c);
    }
    return out;
}

std::string strip_accents(std::string_view text) {
    return to_utf8(strip_accents(to_codepoints(text)));
}

bool is_space(char32_t c) { return u_isspace(static_cast<UChar32>(c)) != 0; }

std::string lstrip(std::string_view text) {
    std::u32string cps = to_codepoints(text);
    size_t begin = 0;
    while (begin < cps.size() && is_space(cps[begin])) ++begin;
    return to_utf8(std::u32string_view(cps).substr(begin));
}

std::string rstrip(std::string_view text) {
    std::u32string cps = to_codepoints(text);
    size_t end = cps.size();
    while (end > 0 && is_space(cps[end - 1])) --end;
    return to_utf8(std::u32string_view(cps).substr(0, end));
}

std::string strip(std::string_view text) { return lstrip(rstrip(text)); }

std::vector<std::string> whitespace_split(std::string_view text) {
    std::vector<std::string> words;
    std::u32string current;
    for (char32_t c : to_codepoints(text)) {
        if (is_space(c)) {
            if (!current.empty()) {
                words.push_back(to_utf8(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        words.push_back(to_utf8(current));
    }
    return words;
}

} // namespace tokalign::text
