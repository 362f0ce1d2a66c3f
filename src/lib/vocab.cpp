#include "vocab.hpp"
#include "errors.hpp"
#include <algorithm>

namespace tokalign {

Vocab::Vocab(std::vector<std::string> tokens_in, std::string unk_token)
    : tokens(std::move(tokens_in)), unk(std::move(unk_token)) {
    token_to_id.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        token_to_id[tokens[i]] = static_cast<TokenId>(i);
    }
    if (!unk.empty()) {
        unk_id = find(unk);
    }
}

bool Vocab::contains(const std::string &token) const {
    return token_to_id.contains(token);
}

std::optional<TokenId> Vocab::find(const std::string &token) const {
    auto it = token_to_id.find(token);
    if (it == token_to_id.end()) return std::nullopt;
    return it->second;
}

std::optional<TokenId> Vocab::to_id(const std::string &token) const {
    auto id = find(token);
    return id ? id : unk_id;
}

const std::string &Vocab::to_token(TokenId id) const {
    if (id >= tokens.size()) {
        throw UsageError("token id " + std::to_string(id) +
                         " is outside the vocabulary (size " +
                         std::to_string(tokens.size()) + ")");
    }
    return tokens[id];
}

Vocabulary::Vocabulary(Vocab base_vocab) : base(std::move(base_vocab)) {}

bool Vocabulary::is_known(const std::string &token) const {
    return added_encoder.contains(token) || base.contains(token);
}

std::optional<TokenId> Vocabulary::token_to_id(const std::string &token) const {
    auto it = added_encoder.find(token);
    if (it != added_encoder.end()) return it->second;
    return base.to_id(token);
}

const std::string &Vocabulary::id_to_token(TokenId id) const {
    auto it = added_decoder.find(id);
    if (it != added_decoder.end()) return it->second;
    return base.to_token(id);
}

std::vector<TokenId> Vocabulary::append(const std::vector<std::string> &tokens) {
    std::vector<TokenId> ids;
    ids.reserve(tokens.size());
    for (const auto &token : tokens) {
        if (added_encoder.contains(token)) {
            throw UsageError("token '" + token + "' is already in the overlay");
        }
        const auto id = static_cast<TokenId>(size());
        added_encoder.emplace(token, id);
        added_decoder.emplace(id, token);
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::pair<std::string, TokenId>> Vocabulary::added_tokens() const {
    std::vector<std::pair<std::string, TokenId>> out(added_encoder.begin(),
                                                     added_encoder.end());
    std::sort(out.begin(), out.end(),
              [](const auto &a, const auto &b) { return a.second < b.second; });
    return out;
}

} // namespace tokalign
