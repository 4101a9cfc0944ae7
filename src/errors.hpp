#pragma once

#include <stdexcept>
#include <string>

namespace runbox {

// Unrecoverable filesystem failure while managing session directories.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidSessionKeyError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// The execution context could not be turned into a script preamble.
class ContextSerializationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace runbox
