#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tfs::fs::id {

/// Source of new folder/file/version/blob identifiers.
///
/// Without a request key every call returns a fresh random UUID, so a replayed transaction
/// creates entities under new ids. With a request key the n-th id of a logical operation is a
/// name-based UUID of (key, n): every attempt of the same operation yields the same ids.
/// Construct one generator per transaction attempt.
class Generator {
public:
    Generator() = default;
    explicit Generator(std::optional<std::string> requestKey) : requestKey_(std::move(requestKey)) {}

    [[nodiscard]] std::string next();

    [[nodiscard]] bool keyed() const { return requestKey_.has_value(); }

    [[nodiscard]] static std::string random();

private:
    std::optional<std::string> requestKey_;
    unsigned int sequence_ = 0;
};

}
