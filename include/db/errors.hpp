#pragma once

#include <stdexcept>
#include <string>

namespace tfs::db {

// Contention, lost session, timeout. The whole transaction may be replayed.
class TransientError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unique key violated. Retrying the same statements cannot succeed.
class ConstraintError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RetriesExhaustedError : public std::runtime_error {
public:
    RetriesExhaustedError(const std::string& ctx, const unsigned int attempts, const std::string& cause)
        : std::runtime_error("Transaction '" + ctx + "' failed after " + std::to_string(attempts) + " attempts: " + cause),
          attempts_(attempts) {}

    [[nodiscard]] unsigned int attempts() const { return attempts_; }

private:
    unsigned int attempts_;
};

}
