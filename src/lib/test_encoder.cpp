#include "errors.hpp"
#include "layout.hpp"
#include "tokenizer.hpp"
#include <cassert>

using namespace tokalign;

static std::vector<std::string> bert_vocab() {
    return {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "[MASK]", "hello",
            "world", "the",   "quick", "brown", "fox",    "un",
            "##aff", "##able", ",",    ".",     "!",      "jumps",
            "over",  "lazy",  "dog",   "a",     "##b",    "is"};
}

static TokenizerConfig bert_config() {
    TokenizerConfig config;
    config.do_lower_case = true;
    config.layout = LayoutType::bert;
    config.special_tokens.unk_token = "[UNK]";
    config.special_tokens.sep_token = "[SEP]";
    config.special_tokens.pad_token = "[PAD]";
    config.special_tokens.cls_token = "[CLS]";
    config.special_tokens.mask_token = "[MASK]";
    return config;
}

// t0 .. t19, no special tokens
static std::vector<std::string> plain_vocab() {
    std::vector<std::string> tokens;
    for (int i = 0; i < 20; ++i) tokens.push_back("t" + std::to_string(i));
    return tokens;
}

template <typename F> static bool throws_usage_error(F &&f) {
    try {
        f();
    } catch (const UsageError &) {
        return true;
    }
    return false;
}

int main() {
    using Ids = std::vector<TokenId>;
    using Ints = std::vector<int>;

    // Layouts
    {
        BertLayout bert(2, 3);
        const Ids a{5, 6};
        const Ids b{7};
        assert((bert.build_inputs_with_special_tokens(a, nullptr) == Ids{2, 5, 6, 3}));
        assert((bert.build_inputs_with_special_tokens(a, &b) ==
                Ids{2, 5, 6, 3, 7, 3}));
        assert((bert.create_token_type_ids_from_sequences(a, &b) ==
                Ints{0, 0, 0, 0, 1, 1}));
        assert((bert.get_special_tokens_mask(a, &b) == Ints{1, 0, 0, 1, 0, 1}));
        const OffsetList offsets{{0, 5}, {6, 11}};
        const OffsetList pair_offsets{{0, 3}};
        assert((bert.build_offset_mapping_with_special_tokens(offsets,
                                                              &pair_offsets) ==
                OffsetList{{0, 0}, {0, 5}, {6, 11}, {0, 0}, {0, 3}, {0, 0}}));
        assert(bert.num_special_tokens_to_add(false) == 2);
        assert(bert.num_special_tokens_to_add(true) == 3);

        PlainLayout plain;
        assert((plain.build_inputs_with_special_tokens(a, &b) == Ids{5, 6, 7}));
        assert((plain.create_token_type_ids_from_sequences(a, &b) ==
                Ints{0, 0, 0}));
        assert(plain.num_special_tokens_to_add(true) == 0);
    }

    // Single sequence with the default inputs
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        Encoding encoding = tokenizer.encode(std::string("Hello world"));
        assert((encoding.input_ids == Ids{2, 5, 6, 3}));
        assert((*encoding.token_type_ids == Ints{0, 0, 0, 0}));
        assert((*encoding.attention_mask == Ints{1, 1, 1, 1}));
        assert(!encoding.special_tokens_mask);
        assert(!encoding.offset_mapping);
        assert(!encoding.length);
    }

    // Pair with every optional output
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        EncodeOptions options;
        options.return_special_tokens_mask = true;
        options.return_offsets_mapping = true;
        options.return_position_ids = true;
        options.return_length = true;
        Encoding encoding = tokenizer.encode(std::string("hello"),
                                             std::string("the dog"), options);
        assert((encoding.input_ids == Ids{2, 5, 3, 7, 20, 3}));
        assert((*encoding.token_type_ids == Ints{0, 0, 0, 1, 1, 1}));
        assert((*encoding.special_tokens_mask == Ints{1, 0, 1, 0, 0, 1}));
        assert((*encoding.position_ids == Ints{0, 1, 2, 3, 4, 5}));
        assert(*encoding.length == 6);
        assert((*encoding.offset_mapping ==
                OffsetList{{0, 0}, {0, 5}, {0, 0}, {0, 3}, {4, 7}, {0, 0}}));
    }

    // Without special tokens
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        EncodeOptions options;
        options.add_special_tokens = false;
        Encoding encoding = tokenizer.encode(std::string("hello"),
                                             std::string("world"), options);
        assert((encoding.input_ids == Ids{5, 6}));

        options.return_token_type_ids = true;
        assert(throws_usage_error([&] {
            tokenizer.encode(std::string("hello"), std::nullopt, options);
        }));
    }

    // Token lists, words and ids as input
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        Encoding encoding =
            tokenizer.encode(std::vector<std::string>{"hello", "world"});
        assert((encoding.input_ids == Ids{2, 5, 6, 3}));

        EncodeOptions options;
        options.add_special_tokens = false;
        options.is_split_into_words = true;
        encoding = tokenizer.encode(
            std::vector<std::string>{"Hello", "unaffable"}, std::nullopt, options);
        assert((encoding.input_ids == Ids{5, 11, 12, 13}));

        encoding = tokenizer.encode(Ids{7, 20});
        assert((encoding.input_ids == Ids{2, 7, 20, 3}));

        assert(throws_usage_error([&] { tokenizer.encode(Ids{}); }));
        assert(throws_usage_error(
            [&] { tokenizer.encode(std::vector<std::string>{}); }));

        EncodeOptions with_offsets;
        with_offsets.return_offsets_mapping = true;
        assert(throws_usage_error(
            [&] { tokenizer.encode(Ids{7, 20}, std::nullopt, with_offsets); }));
    }

    // Truncation of a single sequence
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        EncodeOptions options;
        options.max_length = 4;
        options.truncation = TruncationStrategy::LongestFirst;
        options.return_overflowing_tokens = true;
        options.return_offsets_mapping = true;
        Encoding encoding =
            tokenizer.encode(std::string("the quick brown fox"), std::nullopt,
                             options);
        assert((encoding.input_ids == Ids{2, 7, 8, 3}));
        // Removed one at a time from the back
        assert((*encoding.overflowing_tokens == Ids{10, 9}));
        assert(*encoding.num_truncated_tokens == 2);
        assert((*encoding.offset_mapping ==
                OffsetList{{0, 0}, {0, 3}, {4, 9}, {0, 0}}));

        // Short enough: nothing is cut
        encoding = tokenizer.encode(std::string("the fox"), std::nullopt, options);
        assert((encoding.input_ids == Ids{2, 7, 10, 3}));
        assert(encoding.overflowing_tokens->empty());
        assert(*encoding.num_truncated_tokens == 0);
    }

    // Truncation of a pair
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        EncodeOptions options;
        options.max_length = 6;
        options.truncation = TruncationStrategy::LongestFirst;
        options.return_overflowing_tokens = true;
        Encoding encoding = tokenizer.encode(
            std::string("the quick brown fox"), std::string("dog"), options);
        assert((encoding.input_ids == Ids{2, 7, 8, 3, 20, 3}));
        assert((*encoding.overflowing_tokens == Ids{10, 9}));

        options.truncation = TruncationStrategy::OnlySecond;
        encoding = tokenizer.encode(std::string("dog"),
                                    std::string("the quick brown fox"), options);
        assert((encoding.input_ids == Ids{2, 20, 3, 7, 8, 3}));
        assert((*encoding.overflowing_tokens == Ids{9, 10}));

        // The first sequence is too short to lose three tokens
        options.truncation = TruncationStrategy::OnlyFirst;
        options.max_length = 5;
        encoding = tokenizer.encode(std::string("dog"),
                                    std::string("the quick brown fox"), options);
        assert(encoding.input_ids.size() == 8);
    }

    // truncate_sequences on its own
    {
        Ids ids{1, 2, 3, 4, 5};
        auto overflow =
            truncate_sequences(ids, static_cast<Ids *>(nullptr), 2,
                               TruncationStrategy::OnlyFirst, 1);
        assert((ids == Ids{1, 2, 3}));
        assert((overflow == Ids{3, 4, 5}));

        Ids first{1, 2, 3};
        Ids second{4, 5, 6};
        overflow = truncate_sequences(first, &second, 2,
                                      TruncationStrategy::LongestFirst);
        // Ties go to the second sequence
        assert((first == Ids{1, 2}));
        assert((second == Ids{4, 5}));
        assert((overflow == Ids{6, 3}));

        // A single sequence under LongestFirst: the first removal carries
        // the stride context, the second only its own token
        Ids single{1, 2, 3, 4, 5, 6};
        overflow = truncate_sequences(single, static_cast<Ids *>(nullptr), 2,
                                      TruncationStrategy::LongestFirst, 1);
        assert((single == Ids{1, 2, 3, 4}));
        assert((overflow == Ids{5, 6, 5}));

        // The same with a pair: the stride window comes from whichever
        // sequence loses the first token
        Ids longer{1, 2, 3, 4};
        Ids shorter{7, 8};
        overflow = truncate_sequences(longer, &shorter, 3,
                                      TruncationStrategy::LongestFirst, 2);
        assert((longer == Ids{1, 2}));
        assert((shorter == Ids{7}));
        assert((overflow == Ids{2, 3, 4, 3, 8}));

        Ids too_short{1, 2};
        overflow = truncate_sequences(too_short, static_cast<Ids *>(nullptr), 2,
                                      TruncationStrategy::LongestFirst, 1);
        assert((too_short == Ids{1, 2}));
        assert(overflow.empty());

        Ids unchanged{1, 2};
        overflow = truncate_sequences(unchanged, static_cast<Ids *>(nullptr), 2,
                                      TruncationStrategy::OnlyFirst);
        assert((unchanged == Ids{1, 2}));
        assert(overflow.empty());
    }

    // Padding a batch
    {
        BatchEncoding batch(2);
        batch[0].input_ids = {1, 2};
        batch[1].input_ids = {1, 2, 3, 4};
        PadSettings settings;
        settings.pad_token_id = 0;
        pad(batch, PaddingStrategy::Longest, std::nullopt, std::nullopt, true,
            settings);
        assert((batch[0].input_ids == Ids{1, 2, 0, 0}));
        assert((batch[1].input_ids == Ids{1, 2, 3, 4}));
        assert((*batch[0].attention_mask == Ints{1, 1, 0, 0}));
        assert((*batch[1].attention_mask == Ints{1, 1, 1, 1}));

        BatchEncoding left(1);
        left[0].input_ids = {7, 8};
        left[0].token_type_ids = Ints{0, 0};
        left[0].special_tokens_mask = Ints{0, 0};
        left[0].offset_mapping = OffsetList{{0, 1}, {1, 2}};
        settings.side = PaddingSide::left;
        settings.pad_token_type_id = 2;
        pad(left, PaddingStrategy::MaxLength, 3, std::nullopt, true, settings);
        assert((left[0].input_ids == Ids{0, 7, 8}));
        assert((*left[0].attention_mask == Ints{0, 1, 1}));
        assert((*left[0].token_type_ids == Ints{2, 0, 0}));
        assert((*left[0].special_tokens_mask == Ints{1, 0, 0}));
        assert((*left[0].offset_mapping == OffsetList{{0, 0}, {0, 1}, {1, 2}}));

        BatchEncoding rounded(1);
        rounded[0].input_ids = {1, 2, 3};
        pad(rounded, PaddingStrategy::Longest, std::nullopt, 8, false,
            PadSettings{0, 0, PaddingSide::right});
        assert(rounded[0].input_ids.size() == 8);
        assert(!rounded[0].attention_mask);

        assert(throws_usage_error([&] {
            pad(rounded, PaddingStrategy::MaxLength, std::nullopt, std::nullopt,
                true, settings);
        }));

        BatchEncoding no_pad(2);
        no_pad[0].input_ids = {1};
        no_pad[1].input_ids = {1, 2};
        assert(throws_usage_error([&] {
            pad(no_pad, PaddingStrategy::Longest, std::nullopt, std::nullopt,
                true, PadSettings{});
        }));
    }

    // Padding through encode and the configured side
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        EncodeOptions options;
        options.padding = PaddingStrategy::MaxLength;
        options.max_length = 6;
        Encoding encoding = tokenizer.encode(std::string("hello world"),
                                             std::nullopt, options);
        assert((encoding.input_ids == Ids{2, 5, 6, 3, 0, 0}));
        assert((*encoding.attention_mask == Ints{1, 1, 1, 1, 0, 0}));

        TokenizerConfig config = bert_config();
        config.padding_side = PaddingSide::left;
        config.model_input_names = {"input_ids"};
        Tokenizer left(bert_vocab(), config);
        encoding = left.encode(std::string("hello world"), std::nullopt, options);
        assert((encoding.input_ids == Ids{0, 0, 2, 5, 6, 3}));
        assert(!encoding.attention_mask);
        assert(!encoding.token_type_ids);
    }

    // Batches are padded together, in input order, with or without threads
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        std::vector<EncodeExample> examples{
            {std::string("hello"), std::nullopt},
            {std::string("the quick brown fox"), std::nullopt},
            {std::string("hello"), std::string("world")},
        };
        EncodeOptions options;
        options.padding = PaddingStrategy::Longest;

        for (size_t threads : {1, 3}) {
            options.num_threads = threads;
            BatchEncoding batch = tokenizer.encode_batch(examples, options);
            assert(batch.size() == 3);
            assert((batch[0].input_ids == Ids{2, 5, 3, 0, 0, 0}));
            assert((*batch[0].attention_mask == Ints{1, 1, 1, 0, 0, 0}));
            assert((batch[1].input_ids == Ids{2, 7, 8, 9, 10, 3}));
            assert((*batch[1].attention_mask == Ints{1, 1, 1, 1, 1, 1}));
            assert((batch[2].input_ids == Ids{2, 5, 3, 6, 3, 0}));
            assert((*batch[2].token_type_ids == Ints{0, 0, 0, 1, 1, 0}));
        }

        // The first failing example is reported
        examples.push_back({Ids{}, std::nullopt});
        options.num_threads = 2;
        assert(throws_usage_error(
            [&] { tokenizer.encode_batch(examples, options); }));
    }

    // Sliding windows over the second sequence
    {
        Tokenizer tokenizer(plain_vocab(), TokenizerConfig());
        std::vector<EncodeExample> examples{
            {Ids{1, 2}, Ids{10, 11, 12, 13, 14, 15, 16, 17, 18, 19}},
        };
        EncodeOptions options;
        options.max_length = 6;
        options.stride = 2;
        BatchEncoding batch = tokenizer.encode_batch(examples, options);
        assert(batch.size() == 4);
        assert((batch[0].input_ids == Ids{1, 2, 10, 11, 12, 13}));
        assert((batch[1].input_ids == Ids{1, 2, 12, 13, 14, 15}));
        assert((batch[2].input_ids == Ids{1, 2, 14, 15, 16, 17}));
        assert((batch[3].input_ids == Ids{1, 2, 16, 17, 18, 19}));
        for (const auto &encoding : batch) {
            assert(*encoding.overflow_to_sample == 0);
            assert((*encoding.attention_mask == Ints(6, 1)));
        }

        // Without a pair the example is encoded once
        examples.push_back({Ids{3, 4, 5}, std::nullopt});
        batch = tokenizer.encode_batch(examples, options);
        assert(batch.size() == 5);
        assert((batch[4].input_ids == Ids{3, 4, 5}));
        assert(!batch[4].overflow_to_sample);

        options.max_length = 2;
        assert(throws_usage_error(
            [&] { tokenizer.encode_batch(examples, options); }));
        options.max_length = std::nullopt;
        assert(throws_usage_error(
            [&] { tokenizer.encode_batch(examples, options); }));
    }

    // Windows with the bert layout carry offsets for every window
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        std::vector<EncodeExample> examples{
            {std::string("hello"), std::string("the quick brown fox")},
        };
        EncodeOptions options;
        options.max_length = 6;
        options.stride = 1;
        options.return_offsets_mapping = true;
        BatchEncoding batch = tokenizer.encode_batch(examples, options);
        assert(batch.size() == 3);
        assert((batch[0].input_ids == Ids{2, 5, 3, 7, 8, 3}));
        assert((batch[1].input_ids == Ids{2, 5, 3, 8, 9, 3}));
        assert((batch[2].input_ids == Ids{2, 5, 3, 9, 10, 3}));
        assert((*batch[2].offset_mapping ==
                OffsetList{{0, 0}, {0, 5}, {0, 0}, {10, 15}, {16, 19}, {0, 0}}));
    }

    // Special-token masks
    {
        Tokenizer tokenizer(bert_vocab(), bert_config());
        const Ids ids{2, 5, 3};
        assert((tokenizer.get_special_tokens_mask(ids, nullptr, true) ==
                Ints{1, 0, 1}));
        assert((tokenizer.get_special_tokens_mask(Ids{5}, nullptr) ==
                Ints{1, 0, 1}));
        assert(throws_usage_error(
            [&] { tokenizer.get_special_tokens_mask(ids, &ids, true); }));
    }

    // Offsets that disagree with the ids
    {
        PreTokenizer doubling = [](const std::string &input) {
            return input + " " + input;
        };
        Tokenizer tokenizer(bert_vocab(), bert_config(), doubling);
        EncodeOptions options;
        options.return_offsets_mapping = true;
        bool threw = false;
        try {
            tokenizer.encode(std::string("hello"), std::nullopt, options);
        } catch (const AlignmentError &) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
