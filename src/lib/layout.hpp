#pragma once

#include "config.hpp"
#include "encoding.hpp"
#include "vocab.hpp"
#include <memory>
#include <vector>

namespace tokalign {

// Model-specific placement of special tokens around one or two sequences.
// A null pair means a single sequence.
class SpecialTokensLayout {
  public:
    virtual ~SpecialTokensLayout() = default;

    virtual std::vector<TokenId>
    build_inputs_with_special_tokens(const std::vector<TokenId> &ids,
                                     const std::vector<TokenId> *pair_ids) const = 0;

    virtual std::vector<int>
    create_token_type_ids_from_sequences(const std::vector<TokenId> &ids,
                                         const std::vector<TokenId> *pair_ids) const = 0;

    virtual OffsetList build_offset_mapping_with_special_tokens(
        const OffsetList &offsets, const OffsetList *pair_offsets) const = 0;

    // 1 where build_inputs_with_special_tokens inserts a special token
    virtual std::vector<int>
    get_special_tokens_mask(const std::vector<TokenId> &ids,
                            const std::vector<TokenId> *pair_ids) const = 0;

    size_t num_special_tokens_to_add(bool pair) const;
};

// Sequences are concatenated as-is
class PlainLayout : public SpecialTokensLayout {
  public:
    std::vector<TokenId>
    build_inputs_with_special_tokens(const std::vector<TokenId> &ids,
                                     const std::vector<TokenId> *pair_ids) const override;
    std::vector<int>
    create_token_type_ids_from_sequences(const std::vector<TokenId> &ids,
                                         const std::vector<TokenId> *pair_ids) const override;
    OffsetList build_offset_mapping_with_special_tokens(
        const OffsetList &offsets, const OffsetList *pair_offsets) const override;
    std::vector<int>
    get_special_tokens_mask(const std::vector<TokenId> &ids,
                            const std::vector<TokenId> *pair_ids) const override;
};

// [CLS] A [SEP] and [CLS] A [SEP] B [SEP]
class BertLayout : public SpecialTokensLayout {
  public:
    BertLayout(TokenId cls_id, TokenId sep_id) : cls_id(cls_id), sep_id(sep_id) {}

    std::vector<TokenId>
    build_inputs_with_special_tokens(const std::vector<TokenId> &ids,
                                     const std::vector<TokenId> *pair_ids) const override;
    std::vector<int>
    create_token_type_ids_from_sequences(const std::vector<TokenId> &ids,
                                         const std::vector<TokenId> *pair_ids) const override;
    OffsetList build_offset_mapping_with_special_tokens(
        const OffsetList &offsets, const OffsetList *pair_offsets) const override;
    std::vector<int>
    get_special_tokens_mask(const std::vector<TokenId> &ids,
                            const std::vector<TokenId> *pair_ids) const override;

  private:
    TokenId cls_id;
    TokenId sep_id;
};

// The bert layout needs ids for both cls_token and sep_token (ConfigError
// otherwise)
std::unique_ptr<SpecialTokensLayout>
make_layout(LayoutType type, std::optional<TokenId> cls_id,
            std::optional<TokenId> sep_id);

} // namespace tokalign
