#pragma once

#include <stdexcept>
#include <string>

namespace tfs::fs {

class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class AlreadyExistsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Stored bytes or folder links that cannot be interpreted. Never retried.
class DataCorruptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
