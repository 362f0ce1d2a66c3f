#include "encoding.hpp"
#include "errors.hpp"
#include <absl/strings/str_replace.h>

namespace tokalign {

namespace {

template <typename T>
void pad_field(std::vector<T> &values, size_t difference, const T &value,
               PaddingSide side) {
    if (side == PaddingSide::right) {
        values.insert(values.end(), difference, value);
    } else {
        values.insert(values.begin(), difference, value);
    }
}

size_t round_up(size_t length, std::optional<size_t> multiple) {
    if (!multiple || *multiple == 0 || length % *multiple == 0) return length;
    return (length / *multiple + 1) * *multiple;
}

} // namespace

void pad(BatchEncoding &batch, PaddingStrategy strategy,
         std::optional<size_t> max_length,
         std::optional<size_t> pad_to_multiple_of, bool return_attention_mask,
         const PadSettings &settings) {
    size_t target = 0;
    switch (strategy) {
    case PaddingStrategy::DoNotPad:
        break;
    case PaddingStrategy::Longest:
        for (const auto &encoding : batch) {
            target = std::max(target, encoding.input_ids.size());
        }
        break;
    case PaddingStrategy::MaxLength:
        if (!max_length) {
            throw UsageError("padding=MaxLength requires max_length");
        }
        target = *max_length;
        break;
    }
    target = round_up(target, pad_to_multiple_of);

    for (auto &encoding : batch) {
        const size_t length = encoding.input_ids.size();
        if (return_attention_mask && !encoding.attention_mask) {
            encoding.attention_mask = std::vector<int>(length, 1);
        }
        if (strategy == PaddingStrategy::DoNotPad || length >= target) continue;

        if (!settings.pad_token_id) {
            throw UsageError(
                "padding requested but the tokenizer has no pad_token");
        }
        const size_t difference = target - length;
        const PaddingSide side = settings.side;
        pad_field(encoding.input_ids, difference, *settings.pad_token_id, side);
        if (encoding.attention_mask) {
            pad_field(*encoding.attention_mask, difference, 0, side);
        }
        if (encoding.token_type_ids) {
            pad_field(*encoding.token_type_ids, difference,
                      settings.pad_token_type_id, side);
        }
        if (encoding.special_tokens_mask) {
            pad_field(*encoding.special_tokens_mask, difference, 1, side);
        }
        if (encoding.offset_mapping) {
            pad_field(*encoding.offset_mapping, difference, OffsetPair{0, 0},
                      side);
        }
        if (encoding.position_ids) {
            pad_field(*encoding.position_ids, difference, 0, side);
        }
    }
}

std::string clean_up_tokenization(const std::string &text) {
    return absl::StrReplaceAll(text, {{" .", "."},
                                      {" ?", "?"},
                                      {" !", "!"},
                                      {" ,", ","},
                                      {" ' ", "'"},
                                      {" n't", "n't"},
                                      {" 'm", "'m"},
                                      {" 's", "'s"},
                                      {" 've", "'ve"},
                                      {" 're", "'re"}});
}

} // namespace tokalign
