#include "io.hpp"
#include <cereal/archives/binary.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tokalign {

template <class Archive> void serialize(Archive &archive, AddedToken &token) {
    archive(token.content, token.lstrip, token.rstrip, token.single_word,
            token.normalized);
}

template <class Archive>
void serialize(Archive &archive, SpecialTokensInput &tokens) {
    archive(tokens.bos_token, tokens.eos_token, tokens.unk_token,
            tokens.sep_token, tokens.pad_token, tokens.cls_token,
            tokens.mask_token, tokens.additional_special_tokens,
            tokens.behaviors);
}

template <class Archive>
void serialize(Archive &archive, TokenizerConfig &config) {
    archive(config.special_tokens, config.added_tokens, config.do_lower_case,
            config.strip_accents, config.tokenize_chinese_chars,
            config.normalize_chars, config.tokenize_special_chars, config.model,
            config.pattern, config.continuing_subword_prefix,
            config.max_input_chars_per_word, config.layout,
            config.model_max_length, config.padding_side,
            config.pad_token_type_id, config.model_input_names, config.verbose,
            config.vocab_file);
}

namespace io {

std::string read_file(const std::string &path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::vector<std::string> load_vocab(const std::string &filename) {
    const std::string contents = read_file(filename);
    std::vector<std::string> tokens;
    size_t start = 0;
    while (start < contents.size()) {
        size_t end = contents.find('\n', start);
        if (end == std::string::npos) end = contents.size();
        tokens.emplace_back(contents, start, end - start);
        start = end + 1;
    }
    return tokens;
}

void save_vocab(const std::vector<std::string> &tokens,
                const std::string &filename) {
    std::ofstream file(filename, std::ios::out | std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open " + filename + " for writing");
    }
    for (const auto &token : tokens) {
        file << token << '\n';
    }
    if (!file) {
        throw std::runtime_error("Failed to write to " + filename);
    }
}

void save(const Tokenizer &tokenizer, const std::string &filename) {
    std::ofstream os(filename, std::ios::binary);
    if (!os.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " +
                                 filename);
    }

    cereal::BinaryOutputArchive archive(os);
    archive(tokenizer.config());
    archive(tokenizer.vocabulary().base_vocab().id_to_token());

    // Overlay in id order, so replaying the additions gives the same ids
    std::vector<std::string> added;
    for (const auto &[token, id] : tokenizer.vocabulary().added_tokens()) {
        added.push_back(token);
    }
    archive(added);
    archive(tokenizer.all_special_tokens());
    archive(tokenizer.token_behaviors());
}

Tokenizer load(const std::string &filename, PreTokenizer pre_tokenizer) {
    std::ifstream is(filename, std::ios::binary);
    if (!is.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " +
                                 filename);
    }

    TokenizerConfig config;
    std::vector<std::string> base_tokens;
    std::vector<std::string> added;
    std::vector<std::string> specials;
    std::vector<AddedToken> behaviors;

    cereal::BinaryInputArchive archive(is);
    archive(config);
    archive(base_tokens);
    archive(added);
    archive(specials);
    archive(behaviors);

    Tokenizer tokenizer(std::move(base_tokens), std::move(config),
                        std::move(pre_tokenizer));
    for (const auto &token : added) {
        if (tokenizer.vocabulary().is_added(token)) continue;
        const bool special =
            std::find(specials.begin(), specials.end(), token) != specials.end();
        tokenizer.add_tokens({token}, special);
    }
    // Special tokens that were already in the base vocabulary
    tokenizer.add_tokens(specials, true);
    tokenizer.add_special_tokens(behaviors);

    const auto restored = tokenizer.vocabulary().added_tokens();
    if (restored.size() != added.size()) {
        throw std::runtime_error("Inconsistent tokenizer snapshot: " + filename);
    }
    for (size_t i = 0; i < added.size(); ++i) {
        if (restored[i].first != added[i]) {
            throw std::runtime_error("Inconsistent tokenizer snapshot: " +
                                     filename);
        }
    }
    return tokenizer;
}

} // namespace io
} // namespace tokalign
