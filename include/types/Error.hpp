#pragma once

#include <stdexcept>
#include <string>

namespace cc::types {

enum class Error {
    SourceNotFound,
    UnsupportedMediaType,
    InvalidDimensions,
    CacheDirCreationFailed,
    DecodeFailed,
    EncodeOrWriteFailed,
    TranscodeFailed
};

std::string to_string(Error err);

// Thrown for failures that abort a request (or construction). Validation
// failures are reported through thumbnail::Result instead.
class ThumbnailError : public std::runtime_error {
public:
    ThumbnailError(Error kind, const std::string& what);

    [[nodiscard]] Error kind() const noexcept { return kind_; }

private:
    Error kind_;
};

}
