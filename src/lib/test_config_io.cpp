#include "config.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "tokenizer.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>

using namespace tokalign;

static const char *kConfig = R"(
tokenizer:
  vocab_file: vocab.txt
  do_lower_case: true
  model: wordpiece
  layout: bert
  model_max_length: 128
  padding_side: left
  max_input_chars_per_word: 50
  special_tokens:
    unk_token: "[UNK]"
    sep_token: "[SEP]"
    pad_token: "[PAD]"
    cls_token: "[CLS]"
    mask_token:
      content: "[MASK]"
      lstrip: true
    additional_special_tokens: ["<ent>"]
  added_tokens: ["bar"]
)";

static bool throws_config_error(const std::string &yaml_text) {
    try {
        parse_config(yaml_text);
    } catch (const ConfigError &) {
        return true;
    }
    return false;
}

static std::vector<std::string> bert_vocab() {
    return {"[PAD]", "[UNK]", "[CLS]", "[SEP]", "[MASK]", "hello",
            "world", "the",   "quick", "brown", "fox",    "un",
            "##aff", "##able", ",",    ".",     "!",      "jumps",
            "over",  "lazy",  "dog",   "a",     "##b",    "is"};
}

int main() {
    // Parsing a full configuration
    {
        TokenizerConfig config = parse_config(kConfig);
        assert(config.vocab_file == "vocab.txt");
        assert(config.do_lower_case);
        assert(!config.strip_accents);
        assert(config.resolved_strip_accents());
        assert(config.model == ModelType::wordpiece);
        assert(config.layout == LayoutType::bert);
        assert(*config.model_max_length == 128);
        assert(config.padding_side == PaddingSide::left);
        assert(config.max_input_chars_per_word == 50);
        assert(config.special_tokens.unk_token == "[UNK]");
        assert(config.special_tokens.mask_token == "[MASK]");
        assert(config.special_tokens.additional_special_tokens.size() == 1);
        assert(config.special_tokens.behaviors.size() == 1);
        assert(config.special_tokens.behaviors[0].content == "[MASK]");
        assert(config.special_tokens.behaviors[0].lstrip);
        assert(!config.special_tokens.behaviors[0].rstrip);
        assert(config.added_tokens.size() == 1);
        assert(config.added_tokens[0] == "bar");

        auto all = config.special_tokens.all();
        assert((all == std::vector<std::string>{"[UNK]", "[SEP]", "[PAD]",
                                                "[CLS]", "[MASK]", "<ent>"}));
    }

    // Missing keys keep their defaults
    {
        TokenizerConfig config = parse_config("tokenizer:\n  verbose: false\n");
        assert(!config.do_lower_case);
        assert(config.model == ModelType::wordpiece);
        assert(config.layout == LayoutType::plain);
        assert(!config.model_max_length);
        assert(config.continuing_subword_prefix == "##");
        assert(config.wants_input("attention_mask"));
        assert(config.special_tokens.all().empty());
    }

    // Malformed configurations
    {
        assert(throws_config_error("other: 1\n"));
        assert(throws_config_error("tokenizer: [\n"));
        assert(throws_config_error("tokenizer:\n  model: bpe\n"));
        assert(throws_config_error("tokenizer:\n  layout: gpt\n"));
        assert(throws_config_error("tokenizer:\n  padding_side: up\n"));
        assert(throws_config_error("tokenizer:\n  do_lower_case: maybe\n"));
        assert(throws_config_error("tokenizer:\n  special_tokens: [a]\n"));
        assert(throws_config_error("tokenizer:\n  added_tokens: foo\n"));
        assert(throws_config_error(
            "tokenizer:\n  special_tokens:\n    unk_token:\n      lstrip: true\n"));

        bool threw = false;
        try {
            load_config("/nonexistent/params.yaml");
        } catch (const ConfigError &) {
            threw = true;
        }
        assert(threw);
    }

    // Loading a configuration file
    {
        const std::string path = "/tmp/tokalign_test_params.yaml";
        {
            std::ofstream file(path);
            file << kConfig;
        }
        TokenizerConfig config = load_config(path);
        assert(config.layout == LayoutType::bert);
        assert(config.special_tokens.cls_token == "[CLS]");
        std::remove(path.c_str());
    }

    // Vocabulary files keep empty lines as tokens
    {
        const std::string path = "/tmp/tokalign_test_vocab.txt";
        io::save_vocab({"a", "", "c"}, path);
        assert(io::read_file(path) == "a\n\nc\n");
        auto tokens = io::load_vocab(path);
        assert((tokens == std::vector<std::string>{"a", "", "c"}));
        std::remove(path.c_str());

        bool threw = false;
        try {
            io::load_vocab("/nonexistent/vocab.txt");
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }

    // A configured tokenizer
    {
        Tokenizer tokenizer(bert_vocab(), parse_config(kConfig));
        // <ent> and bar are new
        assert(tokenizer.size() == 26);
        assert(*tokenizer.convert_token_to_id("<ent>") == 24);
        assert(*tokenizer.convert_token_to_id("bar") == 25);

        // [MASK] only strips on its left
        auto fragments = tokenizer.fragments("a [MASK] b");
        assert(fragments.size() == 3);
        assert(fragments[0].text == "a");
        assert(fragments[2].text == " b");

        EncodeOptions options;
        options.padding = PaddingStrategy::MaxLength;
        Encoding encoding =
            tokenizer.encode(std::string("hello world"), std::nullopt, options);
        assert(encoding.input_ids.size() == 128);
        assert(encoding.input_ids.front() == 0);
        assert(encoding.input_ids.back() == 3);
    }

    // Save and load
    {
        Tokenizer tokenizer(bert_vocab(), parse_config(kConfig));
        tokenizer.add_tokens({"foo"});
        tokenizer.add_special_tokens({AddedToken("<sep2>", false, true)});

        const std::string path = "/tmp/tokalign_test_tokenizer.bin";
        io::save(tokenizer, path);
        Tokenizer loaded = io::load(path);
        std::remove(path.c_str());

        assert(loaded.size() == tokenizer.size());
        assert(loaded.all_special_tokens() == tokenizer.all_special_tokens());
        assert(loaded.no_split_tokens() == tokenizer.no_split_tokens());
        assert(loaded.token_behaviors().size() == tokenizer.token_behaviors().size());
        assert(*loaded.convert_token_to_id("foo") ==
               *tokenizer.convert_token_to_id("foo"));
        assert(*loaded.convert_token_to_id("<sep2>") ==
               *tokenizer.convert_token_to_id("<sep2>"));
        assert(loaded.config().model_max_length == tokenizer.config().model_max_length);
        assert(loaded.config().padding_side == PaddingSide::left);

        const std::string input = "The FOO fox <sep2>  jumps [MASK] over";
        assert(loaded.tokenize(input) == tokenizer.tokenize(input));
        assert(loaded.get_offset_mapping(input) ==
               tokenizer.get_offset_mapping(input));

        bool threw = false;
        try {
            io::load("/nonexistent/tokenizer.bin");
        } catch (const std::runtime_error &) {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
