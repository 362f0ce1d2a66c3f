#pragma once

#include "tokenizer.hpp"
#include <string>
#include <vector>

namespace tokalign::io {

std::string read_file(const std::string &path);

// One token per line; the line number is the id. Only the trailing newline is
// removed, so empty lines are tokens too.
std::vector<std::string> load_vocab(const std::string &filename);
void save_vocab(const std::vector<std::string> &tokens,
                const std::string &filename);

// Binary snapshot of the configuration, the base vocabulary and every token
// added since construction. The pre-tokenizer hook is not saved.
void save(const Tokenizer &tokenizer, const std::string &filename);
Tokenizer load(const std::string &filename, PreTokenizer pre_tokenizer = nullptr);

} // namespace tokalign::io
