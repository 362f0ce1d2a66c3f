#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokalign {

// A special or extra token plus how it absorbs whitespace when found embedded
// in text.
struct AddedToken {
    std::string content;
    bool lstrip;      // eat whitespace on the left
    bool rstrip;      // eat whitespace on the right
    bool single_word; // only match as a whole word
    bool normalized;

    AddedToken() : lstrip(false), rstrip(false), single_word(false), normalized(true) {}
    AddedToken(std::string c, bool l = false, bool r = false, bool sw = false,
               bool n = true)
        : content(std::move(c)), lstrip(l), rstrip(r), single_word(sw),
          normalized(n) {}
};

// Special tokens. Empty strings are unused slots.
struct SpecialTokensInput {
    std::string bos_token;
    std::string eos_token;
    std::string unk_token;
    std::string sep_token;
    std::string pad_token;
    std::string cls_token;
    std::string mask_token;
    std::vector<std::string> additional_special_tokens;
    // Stripping metadata for some of the tokens above, keyed by content.
    // Special tokens without an entry strip whitespace on both sides.
    std::vector<AddedToken> behaviors;

    // Every configured special token, slots first, in declaration order,
    // without duplicates
    std::vector<std::string> all() const;
};

enum class ModelType { wordpiece, pattern };
enum class LayoutType { plain, bert };
enum class PaddingSide { right, left };

struct TokenizerConfig {
    SpecialTokensInput special_tokens;
    // Non-special tokens registered on construction, after the special ones
    std::vector<std::string> added_tokens;

    bool do_lower_case = false;
    // Unset: strip accents whenever do_lower_case is on
    std::optional<bool> strip_accents;
    bool tokenize_chinese_chars = true;
    // Pre-tokenization passes (text::normalize, insert_spaces_around_scripts)
    bool normalize_chars = false;
    bool tokenize_special_chars = false;

    ModelType model = ModelType::wordpiece;
    std::string pattern = R"(\w+|[^\w\s])";
    std::string continuing_subword_prefix = "##";
    size_t max_input_chars_per_word = 100;

    LayoutType layout = LayoutType::plain;
    std::optional<size_t> model_max_length;
    PaddingSide padding_side = PaddingSide::right;
    int pad_token_type_id = 0;
    std::vector<std::string> model_input_names = {"input_ids", "token_type_ids",
                                                  "attention_mask"};
    bool verbose = false;

    // One token per line; read by the tools, not by the Tokenizer itself
    std::string vocab_file;

    bool resolved_strip_accents() const {
        return strip_accents.value_or(do_lower_case);
    }
    bool wants_input(const std::string &name) const;
};

// Reads the `tokenizer:` node of a YAML file. Throws ConfigError.
TokenizerConfig load_config(const std::string &path);
TokenizerConfig parse_config(const std::string &yaml_text);

} // namespace tokalign
