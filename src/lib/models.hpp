#pragma once

#include "config.hpp"
#include "vocab.hpp"
#include <memory>
#include <string>
#include <vector>

namespace reflex {
class Pattern;
}

namespace tokalign {

// Sub-word scheme applied to the plain (non-special) runs of text
class SubTokenizer {
  public:
    virtual ~SubTokenizer() = default;

    virtual std::vector<std::string>
    tokenize_word(const std::string &text, const Vocab &vocab) const = 0;

    // Like tokenize_word, but every piece is a literal (normalized) substring
    // of the input: an unknown token is replaced by the word it stands for.
    // Used to align tokens with the original text.
    virtual std::vector<std::string>
    surface_pieces(const std::string &text, const Vocab &vocab) const = 0;

    virtual std::string
    detokenize(const std::vector<std::string> &tokens) const = 0;

    // Marker in front of word-internal pieces, empty when the scheme has none
    virtual const std::string &continuation_prefix() const = 0;
};

// BERT-style basic tokenization (cleanup, CJK spacing, lower-casing, accent
// stripping, punctuation split) followed by greedy longest-match-first
// WordPiece.
class WordPiece : public SubTokenizer {
  public:
    explicit WordPiece(const TokenizerConfig &config);

    std::vector<std::string> tokenize_word(const std::string &text,
                                           const Vocab &vocab) const override;
    std::vector<std::string> surface_pieces(const std::string &text,
                                            const Vocab &vocab) const override;
    std::string detokenize(const std::vector<std::string> &tokens) const override;
    const std::string &continuation_prefix() const override { return prefix; }

    // Whitespace/punctuation split words, before the WordPiece step
    std::vector<std::string> basic_tokenize(const std::string &text) const;
    // Pieces of a single word, or {unk} if the word cannot be covered
    std::vector<std::string> wordpiece(const std::string &word,
                                       const Vocab &vocab) const;

  private:
    // Case and accent handling, then punctuation split, of one
    // whitespace-delimited token
    void split_word(std::u32string word, std::vector<std::string> &words) const;

    std::string prefix;
    std::string unk;
    size_t max_input_chars_per_word;
    bool do_lower_case;
    bool strip_accents;
    bool tokenize_chinese_chars;
};

// Regex pre-split (RE/flex, Unicode mode). Pieces found in the vocabulary are
// kept whole, the rest falls back to single codepoints.
class PatternTokenizer : public SubTokenizer {
  public:
    explicit PatternTokenizer(const TokenizerConfig &config);
    ~PatternTokenizer() override;

    std::vector<std::string> tokenize_word(const std::string &text,
                                           const Vocab &vocab) const override;
    std::vector<std::string> surface_pieces(const std::string &text,
                                            const Vocab &vocab) const override;
    std::string detokenize(const std::vector<std::string> &tokens) const override;
    const std::string &continuation_prefix() const override { return prefix; }

    std::vector<std::string> split(const std::string &text) const;

  private:
    std::string prefix;
    std::unique_ptr<reflex::Pattern> pattern;
    bool strip_accents;
};

// Throws ConfigError for an invalid pattern
std::unique_ptr<SubTokenizer> make_sub_tokenizer(const TokenizerConfig &config);

} // namespace tokalign
