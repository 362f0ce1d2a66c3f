#include "trie.hpp"
#include <cassert>

using namespace tokalign;

static std::string join(const std::vector<std::string> &fragments) {
    std::string out;
    for (const auto &fragment : fragments) out += fragment;
    return out;
}

int main() {
    // Empty trie leaves the text whole
    {
        Trie trie;
        assert(trie.empty());
        auto fragments = trie.split("Hello World");
        assert(fragments.size() == 1);
        assert(fragments[0] == "Hello World");
        assert(trie.split("").empty());
    }

    // Single marker in the middle
    {
        Trie trie;
        trie.add("<SEP>");
        auto fragments = trie.split("Hello<SEP>World");
        assert(fragments.size() == 3);
        assert(fragments[0] == "Hello");
        assert(fragments[1] == "<SEP>");
        assert(fragments[2] == "World");
    }

    // Markers at both ends and back to back
    {
        Trie trie;
        trie.add("[CLS]");
        trie.add("[SEP]");
        auto fragments = trie.split("[CLS]a[SEP][SEP]");
        assert(fragments.size() == 4);
        assert(fragments[0] == "[CLS]");
        assert(fragments[1] == "a");
        assert(fragments[2] == "[SEP]");
        assert(fragments[3] == "[SEP]");
    }

    // Longest marker wins
    {
        Trie trie;
        trie.add("[CLS]");
        trie.add("extra_id_1");
        trie.add("extra_id_100");
        auto fragments = trie.split("[CLS] This is a extra_id_100");
        assert(fragments.size() == 3);
        assert(fragments[0] == "[CLS]");
        assert(fragments[1] == " This is a ");
        assert(fragments[2] == "extra_id_100");

        fragments = trie.split("extra_id_1 and extra_id_100");
        assert(fragments.size() == 3);
        assert(fragments[0] == "extra_id_1");
        assert(fragments[1] == " and ");
        assert(fragments[2] == "extra_id_100");
    }

    // Overlapping markers: the earliest start is committed
    {
        Trie trie;
        trie.add("AB");
        trie.add("B");
        trie.add("C");
        auto fragments = trie.split("ABC");
        assert(fragments.size() == 2);
        assert(fragments[0] == "AB");
        assert(fragments[1] == "C");
    }

    // Partial matches that never complete are plain text
    {
        Trie trie;
        trie.add("<mask>");
        auto fragments = trie.split("a <mas b <mask>");
        assert(fragments.size() == 2);
        assert(fragments[0] == "a <mas b ");
        assert(fragments[1] == "<mask>");
    }

    // Multi-byte markers
    {
        Trie trie;
        trie.add("§§");
        auto fragments = trie.split("été§§ok");
        assert(fragments.size() == 3);
        assert(fragments[0] == "été");
        assert(fragments[1] == "§§");
        assert(fragments[2] == "ok");
    }

    // Empty markers are ignored, concatenation always gives the input back
    {
        Trie trie;
        trie.add("");
        assert(trie.empty());
        trie.add("ab");
        trie.add("abc");
        trie.add("bcd");
        for (const std::string text :
             {"abcd", "xabcdx", "ababab", "bcdbcd", "", "zzz", "abcabc"}) {
            assert(join(trie.split(text)) == text);
        }
    }

    return 0;
}
