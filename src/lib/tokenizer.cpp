#include "tokenizer.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <absl/container/flat_hash_set.h>
#include <absl/strings/str_join.h>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <unicode/utf8.h>
#include <utility>

namespace tokalign {

namespace {

PreTokenizer compose_pre_tokenizer(PreTokenizer hook,
                                   const TokenizerConfig &config) {
    const bool normalize = config.normalize_chars;
    const bool spaced = config.tokenize_special_chars;
    if (!normalize && !spaced) return hook;
    return [hook = std::move(hook), normalize, spaced](const std::string &input) {
        std::string out = hook ? hook(input) : input;
        if (normalize) out = text::normalize(out);
        if (spaced) out = text::insert_spaces_around_scripts(out);
        return out;
    };
}

} // namespace

Tokenizer::Tokenizer(std::vector<std::string> vocab_tokens,
                     TokenizerConfig config, PreTokenizer hook)
    : tokenizer_config(std::move(config)),
      vocab(Vocab(std::move(vocab_tokens),
                  tokenizer_config.special_tokens.unk_token)),
      model(make_sub_tokenizer(tokenizer_config)),
      pre_tokenizer(compose_pre_tokenizer(std::move(hook), tokenizer_config)) {
    for (const auto &token : tokenizer_config.special_tokens.behaviors) {
        behaviors[token.content] = token;
    }
    add_tokens(tokenizer_config.special_tokens.all(), true);
    add_tokens(tokenizer_config.added_tokens, false);
    special_layout =
        make_layout(tokenizer_config.layout, cls_token_id(), sep_token_id());
}

size_t Tokenizer::add_tokens(const std::vector<std::string> &tokens,
                             bool special) {
    const std::string &unk = tokenizer_config.special_tokens.unk_token;
    const std::optional<TokenId> unk_id = vocab.token_to_id(unk);

    std::vector<std::string> to_add;
    for (const auto &token : tokens) {
        if (token.empty()) {
            throw std::invalid_argument("add_tokens: tokens must not be empty");
        }
        std::string candidate = token;
        if (!special && tokenizer_config.do_lower_case) {
            candidate = text::lower_case(candidate);
        }
        if (candidate == unk) continue;
        // Known tokens resolve to their own id, unknown ones to the unk id
        if (vocab.token_to_id(candidate) != unk_id) continue;
        if (std::find(to_add.begin(), to_add.end(), candidate) != to_add.end()) {
            continue;
        }
        if (tokenizer_config.verbose) {
            std::cout << "[add_tokens] Adding " << candidate
                      << " to the vocabulary" << std::endl;
        }
        to_add.push_back(std::move(candidate));
    }
    vocab.append(to_add);

    // Special tokens are never split, even when they were already in the base
    // vocabulary
    const std::vector<std::string> &protect = special ? tokens : to_add;
    no_split.insert(no_split.end(), protect.begin(), protect.end());
    std::sort(no_split.begin(), no_split.end());
    no_split.erase(std::unique(no_split.begin(), no_split.end()),
                   no_split.end());

    if (special) {
        for (const auto &token : tokens) {
            if (std::find(special_tokens.begin(), special_tokens.end(), token) ==
                special_tokens.end()) {
                special_tokens.push_back(token);
            }
        }
    }
    rebuild_trie();
    return to_add.size();
}

size_t Tokenizer::add_special_tokens(const std::vector<AddedToken> &tokens) {
    std::vector<std::string> contents;
    contents.reserve(tokens.size());
    for (const auto &token : tokens) {
        behaviors[token.content] = token;
        contents.push_back(token.content);
    }
    return add_tokens(contents, true);
}

void Tokenizer::rebuild_trie() {
    Trie fresh;
    for (const auto &token : no_split) {
        const bool is_special =
            std::find(special_tokens.begin(), special_tokens.end(), token) !=
            special_tokens.end();
        if (tokenizer_config.do_lower_case && !is_special) {
            fresh.add(text::lower_case(token));
        } else {
            fresh.add(token);
        }
    }
    trie = std::move(fresh);
}

// Lower-cases everything except literal occurrences of no-split and special
// tokens. At each position the first candidate that matches wins. The text
// between protected tokens is lower-cased as one run.
std::string Tokenizer::lower_case_protected(const std::string &input) const {
    std::vector<const std::string *> candidates;
    candidates.reserve(no_split.size() + special_tokens.size());
    for (const auto &token : no_split) candidates.push_back(&token);
    for (const auto &token : special_tokens) candidates.push_back(&token);

    const auto *bytes = reinterpret_cast<const uint8_t *>(input.data());
    const auto length = static_cast<int32_t>(input.size());
    std::string out;
    out.reserve(input.size());

    int32_t run_start = 0;
    int32_t i = 0;
    while (i < length) {
        const std::string *hit = nullptr;
        for (const std::string *candidate : candidates) {
            if (!candidate->empty() && (*candidate)[0] == input[i] &&
                input.compare(i, candidate->size(), *candidate) == 0) {
                hit = candidate;
                break;
            }
        }
        if (hit) {
            out += text::lower_case(
                std::string_view(input).substr(run_start, i - run_start));
            out += *hit;
            i += static_cast<int32_t>(hit->size());
            run_start = i;
            continue;
        }
        U8_FWD_1(bytes, i, length);
    }
    out += text::lower_case(std::string_view(input).substr(run_start));
    return out;
}

std::vector<Fragment> Tokenizer::split_and_strip(const std::string &input) const {
    std::vector<Fragment> pieces;
    for (auto &piece : trie.split(input)) {
        const bool special =
            std::binary_search(no_split.begin(), no_split.end(), piece);
        pieces.push_back({std::move(piece), special});
    }

    // A single-word token glued to a word is plain text
    for (size_t i = 0; i < pieces.size(); ++i) {
        if (!pieces[i].special) continue;
        auto it = behaviors.find(pieces[i].text);
        if (it == behaviors.end() || !it->second.single_word) continue;
        const bool glued_left = i > 0 && !pieces[i - 1].text.empty() &&
                                !text::is_end_of_word(pieces[i - 1].text);
        const bool glued_right = i + 1 < pieces.size() &&
                                 !pieces[i + 1].text.empty() &&
                                 !text::is_start_of_word(pieces[i + 1].text);
        if (glued_left || glued_right) pieces[i].special = false;
    }

    for (size_t i = 0; i < pieces.size(); ++i) {
        if (!pieces[i].special) continue;
        bool strip_left = true;
        bool strip_right = true;
        auto it = behaviors.find(pieces[i].text);
        if (it != behaviors.end()) {
            strip_left = it->second.lstrip;
            strip_right = it->second.rstrip;
        }
        // rstrip eats the whitespace that follows the token, lstrip the
        // whitespace before it
        if (strip_right && i + 1 < pieces.size()) {
            pieces[i + 1].text = text::lstrip(pieces[i + 1].text);
        }
        if (strip_left && i > 0) {
            pieces[i - 1].text = text::rstrip(pieces[i - 1].text);
        }
    }

    std::vector<Fragment> out;
    for (auto &piece : pieces) {
        if (piece.text.empty()) continue;
        if (!piece.special && !out.empty() && !out.back().special) {
            out.back().text += piece.text;
        } else {
            out.push_back(std::move(piece));
        }
    }
    return out;
}

std::vector<Fragment> Tokenizer::fragments(const std::string &input) const {
    std::string prepared = pre_tokenizer ? pre_tokenizer(input) : input;
    if (tokenizer_config.do_lower_case) {
        prepared = lower_case_protected(prepared);
    }
    return split_and_strip(prepared);
}

std::vector<std::string> Tokenizer::tokenize(const std::string &input) const {
    std::vector<std::string> tokens;
    for (auto &fragment : fragments(input)) {
        if (fragment.special) {
            tokens.push_back(std::move(fragment.text));
            continue;
        }
        auto pieces = model->tokenize_word(fragment.text, vocab.base_vocab());
        tokens.insert(tokens.end(), std::make_move_iterator(pieces.begin()),
                      std::make_move_iterator(pieces.end()));
    }
    return tokens;
}

std::optional<TokenId>
Tokenizer::convert_token_to_id(const std::string &token) const {
    return vocab.token_to_id(token);
}

std::vector<TokenId>
Tokenizer::convert_tokens_to_ids(const std::vector<std::string> &tokens) const {
    std::vector<TokenId> ids;
    ids.reserve(tokens.size());
    for (const auto &token : tokens) {
        auto id = vocab.token_to_id(token);
        if (!id) {
            throw UsageError("token '" + token +
                             "' is not in the vocabulary and no unk_token is "
                             "configured");
        }
        ids.push_back(*id);
    }
    return ids;
}

const std::string &Tokenizer::convert_id_to_token(TokenId id) const {
    return vocab.id_to_token(id);
}

std::vector<std::string>
Tokenizer::convert_ids_to_tokens(const std::vector<TokenId> &ids,
                                 bool skip_special_tokens) const {
    absl::flat_hash_set<TokenId> skip;
    if (skip_special_tokens) {
        for (TokenId id : all_special_ids()) skip.insert(id);
    }
    std::vector<std::string> tokens;
    tokens.reserve(ids.size());
    for (TokenId id : ids) {
        if (skip.contains(id)) continue;
        tokens.push_back(vocab.id_to_token(id));
    }
    return tokens;
}

std::string
Tokenizer::convert_tokens_to_string(const std::vector<std::string> &tokens) const {
    return model->detokenize(tokens);
}

// Added tokens are emitted as-is; runs of other tokens go through the
// sub-tokenizer's detokenizer
std::string Tokenizer::decode(const std::vector<TokenId> &ids,
                              bool skip_special_tokens,
                              bool clean_up_tokenization_spaces,
                              bool spaces_between_special_tokens) const {
    std::vector<std::string> sub_texts;
    std::vector<std::string> current;
    for (auto &token : convert_ids_to_tokens(ids, skip_special_tokens)) {
        if (vocab.is_added(token)) {
            if (!current.empty()) {
                sub_texts.push_back(convert_tokens_to_string(current));
                current.clear();
            }
            sub_texts.push_back(std::move(token));
        } else {
            current.push_back(std::move(token));
        }
    }
    if (!current.empty()) {
        sub_texts.push_back(convert_tokens_to_string(current));
    }

    std::string out =
        absl::StrJoin(sub_texts, spaces_between_special_tokens ? " " : "");
    return clean_up_tokenization_spaces ? clean_up_tokenization(out) : out;
}

std::vector<TokenId> Tokenizer::all_special_ids() const {
    std::vector<TokenId> ids;
    for (const auto &token : special_tokens) {
        auto id = vocab.token_to_id(token);
        if (id && std::find(ids.begin(), ids.end(), *id) == ids.end()) {
            ids.push_back(*id);
        }
    }
    return ids;
}

std::vector<AddedToken> Tokenizer::token_behaviors() const {
    std::vector<AddedToken> out;
    out.reserve(behaviors.size());
    for (const auto &[content, token] : behaviors) {
        out.push_back(token);
    }
    std::sort(out.begin(), out.end(),
              [](const AddedToken &a, const AddedToken &b) {
                  return a.content < b.content;
              });
    return out;
}

std::optional<TokenId> Tokenizer::slot_id(const std::string &token) const {
    if (token.empty() || !vocab.is_known(token)) return std::nullopt;
    return vocab.token_to_id(token);
}

std::optional<TokenId> Tokenizer::unk_token_id() const {
    return slot_id(tokenizer_config.special_tokens.unk_token);
}

std::optional<TokenId> Tokenizer::pad_token_id() const {
    return slot_id(tokenizer_config.special_tokens.pad_token);
}

std::optional<TokenId> Tokenizer::cls_token_id() const {
    return slot_id(tokenizer_config.special_tokens.cls_token);
}

std::optional<TokenId> Tokenizer::sep_token_id() const {
    return slot_id(tokenizer_config.special_tokens.sep_token);
}

} // namespace tokalign
