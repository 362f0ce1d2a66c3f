#pragma once

#include <absl/container/flat_hash_map.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokalign {
using TokenId = uint32_t;

// Base vocabulary: ids are dense in [0, size())
class Vocab {
  public:
    Vocab() = default;
    // Token i gets id i. A repeated token keeps its last id.
    explicit Vocab(std::vector<std::string> tokens, std::string unk_token = "");

    size_t size() const { return tokens.size(); }
    bool contains(const std::string &token) const;

    // Base id, else the unknown token's id, else nullopt
    std::optional<TokenId> to_id(const std::string &token) const;
    // Exact base id, no unknown fallback
    std::optional<TokenId> find(const std::string &token) const;
    const std::string &to_token(TokenId id) const;

    const std::string &unk_token() const { return unk; }
    const std::vector<std::string> &id_to_token() const { return tokens; }

  private:
    std::vector<std::string> tokens;
    absl::flat_hash_map<std::string, TokenId> token_to_id;
    std::string unk;
    std::optional<TokenId> unk_id;
};

// Base vocabulary plus the tokens added after it was built. Overlay ids start
// at the base size and stay dense.
class Vocabulary {
  public:
    Vocabulary() = default;
    explicit Vocabulary(Vocab base);

    // Base size plus overlay entries
    size_t size() const { return base.size() + added_encoder.size(); }
    size_t base_size() const { return base.size(); }

    bool is_known(const std::string &token) const;
    bool is_added(const std::string &token) const {
        return added_encoder.contains(token);
    }

    // Overlay, then base, then the unknown token id
    std::optional<TokenId> token_to_id(const std::string &token) const;
    // Overlay inverse, then base. Throws UsageError for an id in neither.
    const std::string &id_to_token(TokenId id) const;

    // Appends tokens to the overlay in order; returns the assigned ids.
    // Callers dedupe: a token already in the overlay is a UsageError.
    std::vector<TokenId> append(const std::vector<std::string> &tokens);

    const Vocab &base_vocab() const { return base; }
    // Added tokens in id order
    std::vector<std::pair<std::string, TokenId>> added_tokens() const;

  private:
    Vocab base;
    absl::flat_hash_map<std::string, TokenId> added_encoder;
    absl::flat_hash_map<TokenId, std::string> added_decoder;
};

} // namespace tokalign
