#pragma once

#include "encoding.hpp"
#include "vocab.hpp"
#include <string>
#include <vector>

namespace tokalign {

// Original text with the span of every token highlighted in a pastel colour
// derived from its id (24-bit ANSI escapes). Text covered by no token is
// printed as-is. Spans are codepoint offsets, as from get_offset_mapping().
std::string visualize(const std::string &text, const std::vector<TokenId> &ids,
                      const OffsetList &offsets);

} // namespace tokalign
