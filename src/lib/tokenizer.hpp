#pragma once

#include "config.hpp"
#include "encoding.hpp"
#include "layout.hpp"
#include "models.hpp"
#include "trie.hpp"
#include "vocab.hpp"
#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tokalign {

// Runs on the raw text before anything else in tokenize()
using PreTokenizer = std::function<std::string(const std::string &)>;

// A run of text after no-split splitting and stripping
struct Fragment {
    std::string text;
    bool special; // equal to a no-split token
};

// Text, a list of tokens (or words when is_split_into_words) or a list of ids
using EncodeInput = std::variant<std::string, std::vector<std::string>,
                                 std::vector<TokenId>>;

struct EncodeExample {
    EncodeInput first;
    std::optional<EncodeInput> second;
};

struct EncodeOptions {
    bool add_special_tokens = true;
    PaddingStrategy padding = PaddingStrategy::DoNotPad;
    TruncationStrategy truncation = TruncationStrategy::DoNotTruncate;
    std::optional<size_t> max_length;
    size_t stride = 0;
    std::optional<size_t> pad_to_multiple_of;
    bool is_split_into_words = false;

    // Unset: follow TokenizerConfig::model_input_names
    std::optional<bool> return_token_type_ids;
    std::optional<bool> return_attention_mask;

    bool return_position_ids = false;
    bool return_overflowing_tokens = false;
    bool return_special_tokens_mask = false;
    bool return_offsets_mapping = false;
    bool return_length = false;

    // encode_batch only; >1 encodes examples on a thread pool
    size_t num_threads = 1;
};

// Text to tokens, ids and encodings over a fixed base vocabulary plus an
// overlay of added tokens. Added and special tokens are never split.
//
// Not copyable. add_tokens() is the only mutating operation; everything else
// is const and may run concurrently once no more tokens are being added.
class Tokenizer {
  public:
    // The base vocabulary is given in id order. Every configured special token
    // is registered as a no-split token, then config.added_tokens.
    Tokenizer(std::vector<std::string> vocab_tokens, TokenizerConfig config,
              PreTokenizer pre_tokenizer = nullptr);

    Tokenizer(Tokenizer &&) = default;
    Tokenizer &operator=(Tokenizer &&) = default;
    Tokenizer(const Tokenizer &) = delete;
    Tokenizer &operator=(const Tokenizer &) = delete;

    std::vector<std::string> tokenize(const std::string &text) const;
    // tokenize() up to (not including) sub-word tokenization
    std::vector<Fragment> fragments(const std::string &text) const;

    // One codepoint span per token of tokenize(text) (without the
    // pre-tokenizer). Throws AlignmentError if a token cannot be located.
    OffsetList get_offset_mapping(const std::string &text) const;

    // Returns the number of tokens actually added to the vocabulary
    size_t add_tokens(const std::vector<std::string> &tokens,
                      bool special = false);
    // add_tokens(..., true) that also records each token's stripping behavior
    size_t add_special_tokens(const std::vector<AddedToken> &tokens);

    std::optional<TokenId> convert_token_to_id(const std::string &token) const;
    // UsageError for a token with no id and no unknown token to fall back to
    std::vector<TokenId>
    convert_tokens_to_ids(const std::vector<std::string> &tokens) const;
    const std::string &convert_id_to_token(TokenId id) const;
    std::vector<std::string>
    convert_ids_to_tokens(const std::vector<TokenId> &ids,
                          bool skip_special_tokens = false) const;
    std::string
    convert_tokens_to_string(const std::vector<std::string> &tokens) const;

    std::string decode(const std::vector<TokenId> &ids,
                       bool skip_special_tokens = false,
                       bool clean_up_tokenization_spaces = true,
                       bool spaces_between_special_tokens = true) const;

    // Adds special tokens, truncates and pads a pair of id sequences.
    // Offsets are attached when requested and given.
    Encoding prepare_for_model(std::vector<TokenId> ids,
                               std::optional<std::vector<TokenId>> pair_ids,
                               const EncodeOptions &options,
                               const OffsetList *offsets = nullptr,
                               const OffsetList *pair_offsets = nullptr) const;

    Encoding encode(const EncodeInput &first,
                    const std::optional<EncodeInput> &second = std::nullopt,
                    const EncodeOptions &options = {}) const;

    // One Encoding per example, or per window when stride > 0 and the example
    // has a pair. Padding is applied to the whole batch at the end.
    BatchEncoding encode_batch(const std::vector<EncodeExample> &examples,
                               const EncodeOptions &options = {}) const;

    std::vector<int>
    get_special_tokens_mask(const std::vector<TokenId> &ids,
                            const std::vector<TokenId> *pair_ids = nullptr,
                            bool already_has_special_tokens = false) const;
    size_t num_special_tokens_to_add(bool pair) const;

    // Configured special tokens plus tokens later added as special
    const std::vector<std::string> &all_special_tokens() const {
        return special_tokens;
    }
    std::vector<TokenId> all_special_ids() const;
    // Sorted, deduplicated
    const std::vector<std::string> &no_split_tokens() const { return no_split; }
    // Stripping metadata for special tokens that have some
    std::vector<AddedToken> token_behaviors() const;

    std::optional<TokenId> unk_token_id() const;
    std::optional<TokenId> pad_token_id() const;
    std::optional<TokenId> cls_token_id() const;
    std::optional<TokenId> sep_token_id() const;

    size_t size() const { return vocab.size(); }
    const Vocabulary &vocabulary() const { return vocab; }
    const TokenizerConfig &config() const { return tokenizer_config; }
    const SubTokenizer &sub_tokenizer() const { return *model; }
    const SpecialTokensLayout &layout() const { return *special_layout; }

  private:
    std::string lower_case_protected(const std::string &text) const;
    std::vector<Fragment> split_and_strip(const std::string &text) const;
    void rebuild_trie();
    std::optional<TokenId> slot_id(const std::string &token) const;

    std::vector<TokenId> input_ids(const EncodeInput &input,
                                   bool is_split_into_words) const;
    OffsetList input_offsets(const EncodeInput &input) const;
    void encode_windows(const EncodeExample &example, size_t example_index,
                        const EncodeOptions &options, BatchEncoding &out) const;
    PadSettings pad_settings() const;

    TokenizerConfig tokenizer_config;
    Vocabulary vocab;
    std::vector<std::string> no_split;
    std::vector<std::string> special_tokens;
    absl::flat_hash_map<std::string, AddedToken> behaviors;
    Trie trie;
    std::unique_ptr<SubTokenizer> model;
    std::unique_ptr<SpecialTokensLayout> special_layout;
    PreTokenizer pre_tokenizer;
};

} // namespace tokalign
