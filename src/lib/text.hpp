#pragma once

#include <string>
#include <string_view>
#include <vector>

// Codepoint classification and text-level transforms. All functions are pure;
// strings are UTF-8, ill-formed sequences decode to U+FFFD.
namespace tokalign::text {

std::u32string to_codepoints(std::string_view text);
std::string to_utf8(std::u32string_view codepoints);
std::string to_utf8(char32_t codepoint);

// Space, tab, newline, carriage return or category Zs
bool is_whitespace(char32_t c);
// Category C*, except tab/newline/CR which count as whitespace
bool is_control(char32_t c);
// All non-alphanumeric printable ASCII, plus category P*
bool is_punctuation(char32_t c);
// Category S*, plus a handful of legacy codepoints some vocabularies treat as
// symbols
bool is_symbol(char32_t c);
// CJK Unified Ideograph blocks only. Hangul and kana are not included.
bool is_cjk(char32_t cp);

// First/last codepoint is control, punctuation or whitespace
bool is_start_of_word(std::string_view text);
bool is_end_of_word(std::string_view text);

// Every CJK codepoint becomes its own fragment; other runs are kept together.
// Joining the fragments gives back the input.
std::vector<std::string> split_on_cjk(std::string_view text);

// Surrounds kana, Greek/Cyrillic, IPA and symbol codepoints with spaces
std::string insert_spaces_around_scripts(std::string_view text);

// Rewrites compatibility forms (fullwidth, enclosed, small variants...) to
// their NFKC expansion and enclosed numbers to " <value> ".
std::string normalize(std::string_view text);

// Full lower-case mapping of a single codepoint (may expand), no context
std::u32string lower_case(char32_t c);
// Lower-casing of a whole string, with context: a capital sigma that ends a
// word becomes the final form U+03C2
std::string lower_case(std::string_view text);

// NFD decomposition with nonspacing marks (Mn) removed
std::u32string strip_accents(std::u32string_view text);
std::string strip_accents(std::string_view text);

bool is_space(char32_t c);
std::string lstrip(std::string_view text);
std::string rstrip(std::string_view text);
std::string strip(std::string_view text);
std::vector<std::string> whitespace_split(std::string_view text);

} // namespace tokalign::text
