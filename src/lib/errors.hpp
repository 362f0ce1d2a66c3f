#pragma once

#include <stdexcept>
#include <string>

namespace tokalign {

// Caller violated a precondition. The message names the offending argument.
class UsageError : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

// A token could not be located in the normalized text while building an
// offset mapping; tokenization and normalization disagree.
class AlignmentError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

} // namespace tokalign
