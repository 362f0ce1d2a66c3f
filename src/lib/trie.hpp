#pragma once

#include <absl/container/flat_hash_map.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tokalign {

// Prefix tree over the no-split tokens. split() isolates every marker found in
// the text as its own fragment, longest marker first, in one left-to-right
// pass.
//
// Matching is done on UTF-8 bytes. A marker is valid UTF-8, so a match can only
// start on a lead byte and always ends on a codepoint boundary.
class Trie {
  public:
    Trie();

    Trie(Trie &&) noexcept = default;
    Trie &operator=(Trie &&) noexcept = default;
    Trie(const Trie &) = delete;
    Trie &operator=(const Trie &) = delete;

    // Empty markers are ignored
    void add(std::string_view marker);

    // Fragments whose concatenation is exactly `text`
    std::vector<std::string> split(std::string_view text) const;

    bool empty() const { return root->children.empty(); }

  private:
    struct Node {
        absl::flat_hash_map<char, std::unique_ptr<Node>> children;
        bool terminal = false;

        const Node *child(char c) const {
            auto it = children.find(c);
            return it == children.end() ? nullptr : it->second.get();
        }
    };

    static std::vector<std::string> cut_text(std::string_view text,
                                             std::vector<size_t> &offsets);

    std::unique_ptr<Node> root;
};

} // namespace tokalign
