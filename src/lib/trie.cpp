#include "trie.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace tokalign {

Trie::Trie() : root(std::make_unique<Node>()) {}

void Trie::add(std::string_view marker) {
    if (marker.empty()) return;
    Node *node = root.get();
    for (char c : marker) {
        auto &slot = node->children[c];
        if (!slot) slot = std::make_unique<Node>();
        node = slot.get();
    }
    node->terminal = true;
}

// Single pass over the text. `states` holds the partial matches still alive,
// ordered by the offset they started at. When one of them completes, the
// partial matches that started at or before it get a chance to extend further
// (so "extra_id_100" wins over "extra_id_1") and the earliest-starting longest
// match is committed. Everything is then reset and scanning resumes after the
// match.
std::vector<std::string> Trie::split(std::string_view text) const {
    struct State {
        size_t start;
        const Node *node;
        bool alive;
    };
    std::vector<State> states;
    std::vector<size_t> offsets{0};
    size_t skip = 0;

    for (size_t current = 0; current < text.size(); ++current) {
        if (skip && current < skip) continue;

        const char current_char = text[current];
        bool reset = false;

        for (auto &state : states) {
            size_t start = state.start;
            if (state.node->terminal) {
                size_t end = 0;
                for (const auto &look : states) {
                    if (look.start > start) break;

                    size_t lookahead_index;
                    if (look.start < start) {
                        // Earlier partial matches already consumed current
                        lookahead_index = current + 1;
                        end = current + 1;
                    } else {
                        lookahead_index = current;
                        end = current;
                    }

                    const Node *looknode = look.node;
                    if (looknode->terminal) {
                        start = look.start;
                        end = lookahead_index;
                        skip = lookahead_index;
                    }
                    while (lookahead_index < text.size()) {
                        const Node *next = looknode->child(text[lookahead_index]);
                        if (!next) break;
                        looknode = next;
                        ++lookahead_index;
                        if (looknode->terminal) {
                            start = look.start;
                            end = lookahead_index;
                            skip = lookahead_index;
                        }
                    }
                }
                offsets.push_back(start);
                offsets.push_back(end);
                reset = true;
                break;
            }

            if (const Node *next = state.node->child(current_char)) {
                state.node = next;
            } else {
                state.alive = false;
            }
        }

        if (reset) {
            states.clear();
        } else {
            states.erase(std::remove_if(states.begin(), states.end(),
                                        [](const State &s) { return !s.alive; }),
                         states.end());
        }

        if (current >= skip) {
            if (const Node *first = root->child(current_char)) {
                states.push_back({current, first, true});
            }
        }
    }

    // Markers that run up to the end of the text. The earliest start is the
    // longest cut.
    for (const auto &state : states) {
        if (state.node->terminal) {
            offsets.push_back(state.start);
            offsets.push_back(text.size());
            break;
        }
    }

    return cut_text(text, offsets);
}

std::vector<std::string> Trie::cut_text(std::string_view text,
                                        std::vector<size_t> &offsets) {
    offsets.push_back(text.size());
    std::vector<std::string> fragments;
    size_t start = 0;
    for (size_t end : offsets) {
        if (start > end) {
            std::cerr << "[trie] Overlapping cut at " << end << " (after "
                      << start << "), skipping" << std::endl;
            continue;
        }
        // Zero-width cuts happen for a match at offset 0 or two adjacent
        // matches
        if (start == end) continue;
        fragments.emplace_back(text.substr(start, end - start));
        start = end;
    }
    return fragments;
}

} // namespace tokalign
