#pragma once

#include "config.hpp"
#include "vocab.hpp"
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokalign {

// Half-open codepoint span into the original text; (0, 0) for special and
// padding positions
using OffsetPair = std::pair<size_t, size_t>;
using OffsetList = std::vector<OffsetPair>;

enum class PaddingStrategy { DoNotPad, Longest, MaxLength };
enum class TruncationStrategy {
    DoNotTruncate,
    LongestFirst,
    OnlyFirst,
    OnlySecond
};

// One encoded example (or one sliding window of it). Fields that were not
// requested stay empty.
struct Encoding {
    std::vector<TokenId> input_ids;
    std::optional<std::vector<int>> token_type_ids;
    std::optional<std::vector<int>> attention_mask;
    std::optional<std::vector<int>> special_tokens_mask;
    std::optional<OffsetList> offset_mapping;
    std::optional<std::vector<int>> position_ids;
    std::optional<size_t> length;
    std::optional<size_t> overflow_to_sample;
    std::optional<std::vector<TokenId>> overflowing_tokens;
    std::optional<size_t> num_truncated_tokens;
};

using BatchEncoding = std::vector<Encoding>;

struct PadSettings {
    std::optional<TokenId> pad_token_id;
    int pad_token_type_id = 0;
    PaddingSide side = PaddingSide::right;
};

// Pads every field of every encoding to a common length. Longest pads to the
// longest input_ids in the batch, MaxLength to max_length; both are rounded
// up to a multiple of pad_to_multiple_of. The attention mask is created (all
// ones) when requested, even if nothing needs padding.
//
// Throws UsageError when padding is needed without a pad token, or for
// MaxLength without max_length.
void pad(BatchEncoding &batch, PaddingStrategy strategy,
         std::optional<size_t> max_length,
         std::optional<size_t> pad_to_multiple_of, bool return_attention_mask,
         const PadSettings &settings);

// Fixes spaces before punctuation and English contractions left by joining
// tokens with spaces
std::string clean_up_tokenization(const std::string &text);

// Removes num_tokens_to_remove elements from the end of ids and/or *pair_ids
// according to strategy and returns the overflowing elements. Shared by ids
// and offset mappings so both are cut the same way.
//
// OnlyFirst and OnlySecond cut the tail of one sequence in a single step; the
// overflow is its last stride + num_tokens_to_remove elements, in order.
// LongestFirst works token by token, see below.
//
// Removing at least as many elements as a sequence holds is logged and leaves
// the sequences unchanged.
template <typename T>
std::vector<T> truncate_sequences(std::vector<T> &ids,
                                  std::vector<T> *pair_ids,
                                  size_t num_tokens_to_remove,
                                  TruncationStrategy strategy,
                                  size_t stride = 0) {
    std::vector<T> overflowing;
    if (num_tokens_to_remove == 0) return overflowing;

    // Overflow keeps `stride` extra elements of context before the cut
    auto cut_tail = [&](std::vector<T> &seq, const char *name) {
        if (seq.size() <= num_tokens_to_remove) {
            std::cerr << "[truncate] Cannot remove " << num_tokens_to_remove
                      << " tokens from " << name << " of length " << seq.size()
                      << "; try another truncation strategy" << std::endl;
            return;
        }
        const size_t window = std::min(seq.size(), stride + num_tokens_to_remove);
        overflowing.assign(seq.end() - window, seq.end());
        seq.resize(seq.size() - num_tokens_to_remove);
    };

    switch (strategy) {
    case TruncationStrategy::DoNotTruncate:
        break;
    case TruncationStrategy::OnlyFirst:
        cut_tail(ids, "the first sequence");
        break;
    case TruncationStrategy::LongestFirst: {
        const size_t total = ids.size() + (pair_ids ? pair_ids->size() : 0);
        if (total <= num_tokens_to_remove) {
            std::cerr << "[truncate] Cannot remove " << num_tokens_to_remove
                      << " tokens from sequences of total length " << total
                      << std::endl;
            break;
        }
        // One token at a time from the longer sequence. The first removal
        // also copies `stride` tokens of context, later ones only the token
        // itself, so the overflow is built from the back.
        for (size_t i = 0; i < num_tokens_to_remove; ++i) {
            std::vector<T> &seq =
                !pair_ids || ids.size() > pair_ids->size() ? ids : *pair_ids;
            const size_t window =
                overflowing.empty() ? std::min(seq.size(), stride + 1) : 1;
            overflowing.insert(overflowing.end(), seq.end() - window, seq.end());
            seq.pop_back();
        }
        break;
    }
    case TruncationStrategy::OnlySecond:
        if (pair_ids) cut_tail(*pair_ids, "the second sequence");
        break;
    }
    return overflowing;
}

} // namespace tokalign
