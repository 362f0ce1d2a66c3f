#include "errors.hpp"
#include "threading.hpp"
#include "tokenizer.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <numeric>

namespace tokalign {

namespace {

std::vector<int> position_ids(size_t length) {
    std::vector<int> ids(length);
    std::iota(ids.begin(), ids.end(), 0);
    return ids;
}

template <typename T>
std::vector<T> concat(const std::vector<T> &first, const std::vector<T> *second) {
    std::vector<T> out = first;
    if (second) out.insert(out.end(), second->begin(), second->end());
    return out;
}

void check_aligned(const std::vector<TokenId> &ids, const OffsetList &offsets) {
    if (ids.size() != offsets.size()) {
        throw AlignmentError("offset mapping has " +
                             std::to_string(offsets.size()) + " entries for " +
                             std::to_string(ids.size()) + " tokens");
    }
}

} // namespace

PadSettings Tokenizer::pad_settings() const {
    PadSettings settings;
    settings.pad_token_id = pad_token_id();
    settings.pad_token_type_id = tokenizer_config.pad_token_type_id;
    settings.side = tokenizer_config.padding_side;
    return settings;
}

size_t Tokenizer::num_special_tokens_to_add(bool pair) const {
    return special_layout->num_special_tokens_to_add(pair);
}

std::vector<int>
Tokenizer::get_special_tokens_mask(const std::vector<TokenId> &ids,
                                   const std::vector<TokenId> *pair_ids,
                                   bool already_has_special_tokens) const {
    if (!already_has_special_tokens) {
        return special_layout->get_special_tokens_mask(ids, pair_ids);
    }
    if (pair_ids) {
        throw UsageError("pair_ids must not be given when "
                         "already_has_special_tokens is true");
    }
    const std::vector<TokenId> special = all_special_ids();
    std::vector<int> mask;
    mask.reserve(ids.size());
    for (TokenId id : ids) {
        mask.push_back(
            std::find(special.begin(), special.end(), id) != special.end() ? 1 : 0);
    }
    return mask;
}

std::vector<TokenId> Tokenizer::input_ids(const EncodeInput &input,
                                          bool is_split_into_words) const {
    if (const auto *raw = std::get_if<std::string>(&input)) {
        return convert_tokens_to_ids(tokenize(*raw));
    }
    if (const auto *tokens = std::get_if<std::vector<std::string>>(&input)) {
        if (tokens->empty()) {
            throw UsageError("input is an empty list; expected text, a list of "
                             "strings or a list of ids");
        }
        if (!is_split_into_words) return convert_tokens_to_ids(*tokens);
        std::vector<std::string> pieces;
        for (const auto &word : *tokens) {
            auto word_tokens = tokenize(word);
            pieces.insert(pieces.end(), word_tokens.begin(), word_tokens.end());
        }
        return convert_tokens_to_ids(pieces);
    }
    const auto &ids = std::get<std::vector<TokenId>>(input);
    if (ids.empty()) {
        throw UsageError("input is an empty list; expected text, a list of "
                         "strings or a list of ids");
    }
    return ids;
}

OffsetList Tokenizer::input_offsets(const EncodeInput &input) const {
    const auto *raw = std::get_if<std::string>(&input);
    if (!raw) {
        throw UsageError(
            "return_offsets_mapping requires text input, not tokens or ids");
    }
    return get_offset_mapping(*raw);
}

Encoding Tokenizer::prepare_for_model(std::vector<TokenId> ids,
                                      std::optional<std::vector<TokenId>> pair_ids,
                                      const EncodeOptions &options,
                                      const OffsetList *offsets,
                                      const OffsetList *pair_offsets) const {
    if (options.return_token_type_ids.value_or(false) &&
        !options.add_special_tokens) {
        throw UsageError("return_token_type_ids=true requires "
                         "add_special_tokens=true");
    }
    const bool want_type_ids = options.return_token_type_ids.value_or(
        tokenizer_config.wants_input("token_type_ids"));
    const bool want_mask = options.return_attention_mask.value_or(
        tokenizer_config.wants_input("attention_mask"));

    const bool pair = pair_ids.has_value();
    const size_t total_len =
        ids.size() + (pair ? pair_ids->size() : 0) +
        (options.add_special_tokens ? num_special_tokens_to_add(pair) : 0);
    const bool too_long = options.max_length && total_len > *options.max_length;
    const size_t excess = too_long ? total_len - *options.max_length : 0;

    Encoding encoding;
    std::vector<TokenId> overflowing;
    if (too_long && options.truncation != TruncationStrategy::DoNotTruncate) {
        overflowing =
            truncate_sequences(ids, pair ? &*pair_ids : nullptr, excess,
                               options.truncation, options.stride);
    }
    if (options.return_overflowing_tokens) {
        encoding.overflowing_tokens = std::move(overflowing);
        encoding.num_truncated_tokens = excess;
    }

    const std::vector<TokenId> *pair_ptr = pair ? &*pair_ids : nullptr;
    std::vector<int> type_ids;
    if (options.add_special_tokens) {
        encoding.input_ids =
            special_layout->build_inputs_with_special_tokens(ids, pair_ptr);
        type_ids =
            special_layout->create_token_type_ids_from_sequences(ids, pair_ptr);
    } else {
        encoding.input_ids = concat(ids, pair_ptr);
        type_ids.assign(encoding.input_ids.size(), 0);
    }
    if (want_type_ids) encoding.token_type_ids = std::move(type_ids);

    if (options.return_special_tokens_mask) {
        encoding.special_tokens_mask =
            options.add_special_tokens
                ? get_special_tokens_mask(ids, pair_ptr)
                : std::vector<int>(encoding.input_ids.size(), 0);
    }

    if (options.return_offsets_mapping && offsets) {
        OffsetList first = *offsets;
        std::optional<OffsetList> second;
        if (pair_offsets) second = *pair_offsets;
        if (too_long) {
            truncate_sequences(first, second ? &*second : nullptr, excess,
                               options.truncation, options.stride);
        }
        const OffsetList *second_ptr = second ? &*second : nullptr;
        encoding.offset_mapping =
            options.add_special_tokens
                ? special_layout->build_offset_mapping_with_special_tokens(
                      first, second_ptr)
                : concat(first, second_ptr);
        check_aligned(encoding.input_ids, *encoding.offset_mapping);
    }

    const auto &model_max = tokenizer_config.model_max_length;
    if (!options.max_length && model_max &&
        encoding.input_ids.size() > *model_max) {
        std::cerr << "[encode] Token sequence length is longer than the "
                     "model maximum ("
                  << encoding.input_ids.size() << " > " << *model_max
                  << "); the model will index out of range" << std::endl;
    }

    if (options.return_position_ids) {
        encoding.position_ids = position_ids(encoding.input_ids.size());
    }

    if (options.padding != PaddingStrategy::DoNotPad || want_mask) {
        BatchEncoding single{std::move(encoding)};
        pad(single, options.padding,
            options.max_length ? options.max_length : model_max,
            options.pad_to_multiple_of, want_mask, pad_settings());
        encoding = std::move(single.front());
    }

    if (options.return_length) encoding.length = encoding.input_ids.size();
    return encoding;
}

Encoding Tokenizer::encode(const EncodeInput &first,
                           const std::optional<EncodeInput> &second,
                           const EncodeOptions &options) const {
    std::vector<TokenId> ids = input_ids(first, options.is_split_into_words);
    std::optional<std::vector<TokenId>> pair_ids;
    if (second) pair_ids = input_ids(*second, options.is_split_into_words);

    if (!options.return_offsets_mapping) {
        return prepare_for_model(std::move(ids), std::move(pair_ids), options);
    }
    const OffsetList offsets = input_offsets(first);
    std::optional<OffsetList> pair_offsets;
    if (second) pair_offsets = input_offsets(*second);
    return prepare_for_model(std::move(ids), std::move(pair_ids), options,
                             &offsets, pair_offsets ? &*pair_offsets : nullptr);
}

// Slides a window over the second sequence; every window is encoded with the
// whole first sequence. Consecutive windows overlap by `stride` tokens.
void Tokenizer::encode_windows(const EncodeExample &example,
                               size_t example_index,
                               const EncodeOptions &options,
                               BatchEncoding &out) const {
    if (!options.max_length) {
        throw UsageError("stride > 0 with a second sequence requires max_length");
    }
    const std::vector<TokenId> first_ids =
        input_ids(example.first, options.is_split_into_words);
    const std::vector<TokenId> second_ids =
        input_ids(*example.second, options.is_split_into_words);

    const size_t overhead =
        options.add_special_tokens ? num_special_tokens_to_add(true) : 0;
    if (*options.max_length <= first_ids.size() + overhead) {
        throw UsageError("max_length " + std::to_string(*options.max_length) +
                         " leaves no room for the second sequence (first "
                         "sequence has " +
                         std::to_string(first_ids.size()) + " tokens, plus " +
                         std::to_string(overhead) + " special tokens)");
    }
    const size_t max_len_for_pair =
        *options.max_length - first_ids.size() - overhead;

    const bool want_type_ids = options.return_token_type_ids.value_or(
        tokenizer_config.wants_input("token_type_ids"));

    OffsetList offsets;
    OffsetList pair_offsets;
    if (options.return_offsets_mapping) {
        offsets = input_offsets(example.first);
        pair_offsets = input_offsets(*example.second);
        check_aligned(first_ids, offsets);
        check_aligned(second_ids, pair_offsets);
    }

    size_t offset = 0;
    while (offset < second_ids.size()) {
        const size_t length =
            std::min(second_ids.size() - offset, max_len_for_pair);
        const std::vector<TokenId> pair_ids(
            second_ids.begin() + static_cast<std::ptrdiff_t>(offset),
            second_ids.begin() + static_cast<std::ptrdiff_t>(offset + length));

        Encoding encoding;
        std::vector<int> type_ids;
        if (options.add_special_tokens) {
            encoding.input_ids =
                special_layout->build_inputs_with_special_tokens(first_ids,
                                                                 &pair_ids);
            type_ids = special_layout->create_token_type_ids_from_sequences(
                first_ids, &pair_ids);
        } else {
            encoding.input_ids = concat(first_ids, &pair_ids);
            type_ids.assign(encoding.input_ids.size(), 0);
        }
        if (want_type_ids) encoding.token_type_ids = std::move(type_ids);

        if (options.return_offsets_mapping) {
            const OffsetList pair_window(
                pair_offsets.begin() + static_cast<std::ptrdiff_t>(offset),
                pair_offsets.begin() +
                    static_cast<std::ptrdiff_t>(offset + length));
            encoding.offset_mapping =
                options.add_special_tokens
                    ? special_layout->build_offset_mapping_with_special_tokens(
                          offsets, &pair_window)
                    : concat(offsets, &pair_window);
        }
        if (options.return_special_tokens_mask) {
            encoding.special_tokens_mask =
                options.add_special_tokens
                    ? get_special_tokens_mask(first_ids, &pair_ids)
                    : std::vector<int>(encoding.input_ids.size(), 0);
        }
        if (options.return_position_ids) {
            encoding.position_ids = position_ids(encoding.input_ids.size());
        }
        if (options.return_length) encoding.length = encoding.input_ids.size();
        encoding.overflow_to_sample = example_index;
        out.push_back(std::move(encoding));

        if (offset + length == second_ids.size()) break;
        offset += std::min(length, options.stride);
    }
}

BatchEncoding Tokenizer::encode_batch(const std::vector<EncodeExample> &examples,
                                      const EncodeOptions &options) const {
    if (options.return_token_type_ids.value_or(false) &&
        !options.add_special_tokens) {
        throw UsageError("return_token_type_ids=true requires "
                         "add_special_tokens=true");
    }

    // Padding and the attention mask are applied once the batch is complete
    EncodeOptions per_example = options;
    per_example.padding = PaddingStrategy::DoNotPad;
    per_example.pad_to_multiple_of = std::nullopt;
    per_example.return_attention_mask = false;

    std::vector<BatchEncoding> results(examples.size());
    auto run = [&](size_t i) {
        const EncodeExample &example = examples[i];
        if (options.stride > 0 && example.second) {
            encode_windows(example, i, options, results[i]);
        } else {
            results[i].push_back(
                encode(example.first, example.second, per_example));
        }
    };

    if (options.num_threads > 1 && examples.size() > 1) {
        threading::ThreadPool pool(std::min(options.num_threads, examples.size()));
        std::vector<std::exception_ptr> errors(examples.size());
        for (size_t i = 0; i < examples.size(); ++i) {
            pool.enqueue([&run, &errors, i]() {
                try {
                    run(i);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        pool.wait();
        // First failing example in input order
        for (const auto &error : errors) {
            if (error) std::rethrow_exception(error);
        }
    } else {
        for (size_t i = 0; i < examples.size(); ++i) run(i);
    }

    BatchEncoding batch;
    for (auto &encodings : results) {
        for (auto &encoding : encodings) batch.push_back(std::move(encoding));
    }

    const bool want_mask = options.return_attention_mask.value_or(
        tokenizer_config.wants_input("attention_mask"));
    pad(batch, options.padding,
        options.max_length ? options.max_length
                           : tokenizer_config.model_max_length,
        options.pad_to_multiple_of, want_mask, pad_settings());
    return batch;
}

} // namespace tokalign
