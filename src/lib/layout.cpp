#include "layout.hpp"
#include "errors.hpp"

namespace tokalign {

size_t SpecialTokensLayout::num_special_tokens_to_add(bool pair) const {
    const std::vector<TokenId> empty;
    return build_inputs_with_special_tokens(empty, pair ? &empty : nullptr)
        .size();
}

std::vector<TokenId>
PlainLayout::build_inputs_with_special_tokens(const std::vector<TokenId> &ids,
                                              const std::vector<TokenId> *pair_ids) const {
    std::vector<TokenId> out = ids;
    if (pair_ids) out.insert(out.end(), pair_ids->begin(), pair_ids->end());
    return out;
}

std::vector<int> PlainLayout::create_token_type_ids_from_sequences(
    const std::vector<TokenId> &ids, const std::vector<TokenId> *pair_ids) const {
    return std::vector<int>(ids.size() + (pair_ids ? pair_ids->size() : 0), 0);
}

OffsetList PlainLayout::build_offset_mapping_with_special_tokens(
    const OffsetList &offsets, const OffsetList *pair_offsets) const {
    OffsetList out = offsets;
    if (pair_offsets) {
        out.insert(out.end(), pair_offsets->begin(), pair_offsets->end());
    }
    return out;
}

std::vector<int>
PlainLayout::get_special_tokens_mask(const std::vector<TokenId> &ids,
                                     const std::vector<TokenId> *pair_ids) const {
    return std::vector<int>(ids.size() + (pair_ids ? pair_ids->size() : 0), 0);
}

std::vector<TokenId>
BertLayout::build_inputs_with_special_tokens(const std::vector<TokenId> &ids,
                                             const std::vector<TokenId> *pair_ids) const {
    std::vector<TokenId> out;
    out.reserve(ids.size() + (pair_ids ? pair_ids->size() + 3 : 2));
    out.push_back(cls_id);
    out.insert(out.end(), ids.begin(), ids.end());
    out.push_back(sep_id);
    if (pair_ids) {
        out.insert(out.end(), pair_ids->begin(), pair_ids->end());
        out.push_back(sep_id);
    }
    return out;
}

std::vector<int> BertLayout::create_token_type_ids_from_sequences(
    const std::vector<TokenId> &ids, const std::vector<TokenId> *pair_ids) const {
    std::vector<int> out(ids.size() + 2, 0);
    if (pair_ids) out.insert(out.end(), pair_ids->size() + 1, 1);
    return out;
}

OffsetList BertLayout::build_offset_mapping_with_special_tokens(
    const OffsetList &offsets, const OffsetList *pair_offsets) const {
    OffsetList out;
    out.push_back({0, 0});
    out.insert(out.end(), offsets.begin(), offsets.end());
    out.push_back({0, 0});
    if (pair_offsets) {
        out.insert(out.end(), pair_offsets->begin(), pair_offsets->end());
        out.push_back({0, 0});
    }
    return out;
}

std::vector<int>
BertLayout::get_special_tokens_mask(const std::vector<TokenId> &ids,
                                    const std::vector<TokenId> *pair_ids) const {
    std::vector<int> out;
    out.push_back(1);
    out.insert(out.end(), ids.size(), 0);
    out.push_back(1);
    if (pair_ids) {
        out.insert(out.end(), pair_ids->size(), 0);
        out.push_back(1);
    }
    return out;
}

std::unique_ptr<SpecialTokensLayout>
make_layout(LayoutType type, std::optional<TokenId> cls_id,
            std::optional<TokenId> sep_id) {
    switch (type) {
    case LayoutType::bert:
        if (!cls_id || !sep_id) {
            throw ConfigError(
                "layout 'bert' needs cls_token and sep_token in the vocabulary");
        }
        return std::make_unique<BertLayout>(*cls_id, *sep_id);
    case LayoutType::plain:
        break;
    }
    return std::make_unique<PlainLayout>();
}

} // namespace tokalign
