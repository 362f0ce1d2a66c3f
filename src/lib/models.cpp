#include "models.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <absl/strings/str_join.h>
#include <reflex/matcher.h>
#include <reflex/pattern.h>
#include <iterator>
#include <utility>

namespace tokalign {

namespace {

// Drops NUL, U+FFFD and control codepoints; every whitespace becomes ' '
std::u32string clean_text(std::u32string_view cps) {
    std::u32string out;
    out.reserve(cps.size());
    for (char32_t c : cps) {
        if (c == 0 || c == 0xFFFD || text::is_control(c)) continue;
        out.push_back(text::is_whitespace(c) ? U' ' : c);
    }
    return out;
}

} // namespace

WordPiece::WordPiece(const TokenizerConfig &config)
    : prefix(config.continuing_subword_prefix),
      unk(config.special_tokens.unk_token.empty()
              ? "[UNK]"
              : config.special_tokens.unk_token),
      max_input_chars_per_word(config.max_input_chars_per_word),
      do_lower_case(config.do_lower_case),
      strip_accents(config.resolved_strip_accents()),
      tokenize_chinese_chars(config.tokenize_chinese_chars) {}

std::vector<std::string> WordPiece::basic_tokenize(const std::string &input) const {
    const std::string cleaned =
        text::to_utf8(clean_text(text::to_codepoints(input)));

    // CJK ideographs become words of their own
    std::vector<std::string> chunks{cleaned};
    if (tokenize_chinese_chars) chunks = text::split_on_cjk(cleaned);

    std::vector<std::string> words;
    for (const auto &chunk : chunks) {
        for (const auto &token : text::whitespace_split(chunk)) {
            split_word(text::to_codepoints(token), words);
        }
    }
    return words;
}

void WordPiece::split_word(std::u32string word,
                           std::vector<std::string> &words) const {
    if (do_lower_case) {
        word = text::to_codepoints(text::lower_case(text::to_utf8(word)));
    }
    if (strip_accents) {
        word = text::strip_accents(word);
    }

    // Every punctuation codepoint is a word of its own
    std::u32string current;
    for (char32_t c : word) {
        if (text::is_punctuation(c)) {
            if (!current.empty()) words.push_back(text::to_utf8(current));
            current.clear();
            words.push_back(text::to_utf8(c));
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) words.push_back(text::to_utf8(current));
}

std::vector<std::string> WordPiece::wordpiece(const std::string &word,
                                              const Vocab &vocab) const {
    const std::u32string cps = text::to_codepoints(word);
    if (cps.size() > max_input_chars_per_word) return {unk};

    std::vector<std::string> pieces;
    size_t start = 0;
    while (start < cps.size()) {
        size_t end = cps.size();
        std::string current;
        bool found = false;
        while (start < end) {
            std::string candidate =
                text::to_utf8(std::u32string_view(cps).substr(start, end - start));
            if (start > 0) candidate = prefix + candidate;
            if (vocab.contains(candidate)) {
                current = std::move(candidate);
                found = true;
                break;
            }
            --end;
        }
        if (!found) return {unk};
        pieces.push_back(std::move(current));
        start = end;
    }
    return pieces;
}

std::vector<std::string> WordPiece::tokenize_word(const std::string &input,
                                                  const Vocab &vocab) const {
    std::vector<std::string> tokens;
    for (const auto &word : basic_tokenize(input)) {
        auto pieces = wordpiece(word, vocab);
        tokens.insert(tokens.end(), std::make_move_iterator(pieces.begin()),
                      std::make_move_iterator(pieces.end()));
    }
    return tokens;
}

std::vector<std::string> WordPiece::surface_pieces(const std::string &input,
                                                   const Vocab &vocab) const {
    std::vector<std::string> tokens;
    for (const auto &word : basic_tokenize(input)) {
        for (auto &piece : wordpiece(word, vocab)) {
            tokens.push_back(piece == unk ? word : std::move(piece));
        }
    }
    return tokens;
}

std::string WordPiece::detokenize(const std::vector<std::string> &tokens) const {
    std::string out = absl::StrJoin(tokens, " ");
    if (!prefix.empty()) {
        const std::string marker = " " + prefix;
        std::string glued;
        glued.reserve(out.size());
        size_t pos = 0;
        for (size_t hit; (hit = out.find(marker, pos)) != std::string::npos;
             pos = hit + marker.size()) {
            glued.append(out, pos, hit - pos);
        }
        glued.append(out, pos, std::string::npos);
        out = std::move(glued);
    }
    return text::strip(out);
}

PatternTokenizer::PatternTokenizer(const TokenizerConfig &config)
    : strip_accents(config.resolved_strip_accents()) {
    try {
        // "r": raise regex_error on a bad pattern instead of warning
        pattern = std::make_unique<reflex::Pattern>(
            reflex::Matcher::convert(config.pattern,
                                     reflex::convert_flag::unicode),
            "r");
    } catch (const reflex::regex_error &e) {
        throw ConfigError("invalid pattern '" + config.pattern +
                          "': " + e.what());
    }
}

PatternTokenizer::~PatternTokenizer() = default;

std::vector<std::string> PatternTokenizer::split(const std::string &input) const {
    std::u32string cps;
    for (char32_t c : text::to_codepoints(input)) {
        if (c == 0 || c == 0xFFFD || text::is_control(c)) continue;
        cps.push_back(c);
    }
    if (strip_accents) cps = text::strip_accents(cps);
    const std::string cleaned = text::to_utf8(cps);

    std::vector<std::string> pieces;
    reflex::Matcher matcher(*pattern, cleaned);
    while (matcher.find() != 0) {
        if (matcher.size() > 0) pieces.push_back(matcher.str());
    }
    return pieces;
}

std::vector<std::string>
PatternTokenizer::tokenize_word(const std::string &input,
                                const Vocab &vocab) const {
    std::vector<std::string> tokens;
    for (auto &piece : split(input)) {
        if (vocab.contains(piece)) {
            tokens.push_back(std::move(piece));
            continue;
        }
        for (char32_t c : text::to_codepoints(piece)) {
            tokens.push_back(text::to_utf8(c));
        }
    }
    return tokens;
}

std::vector<std::string>
PatternTokenizer::surface_pieces(const std::string &input,
                                 const Vocab &vocab) const {
    return tokenize_word(input, vocab);
}

std::string
PatternTokenizer::detokenize(const std::vector<std::string> &tokens) const {
    return absl::StrJoin(tokens, " ");
}

std::unique_ptr<SubTokenizer> make_sub_tokenizer(const TokenizerConfig &config) {
    switch (config.model) {
    case ModelType::pattern:
        return std::make_unique<PatternTokenizer>(config);
    case ModelType::wordpiece:
        break;
    }
    return std::make_unique<WordPiece>(config);
}

} // namespace tokalign
