#include "types/Error.hpp"

namespace cc::types {

std::string to_string(const Error err) {
    switch (err) {
        case Error::SourceNotFound: return "source_not_found";
        case Error::UnsupportedMediaType: return "unsupported_media_type";
        case Error::InvalidDimensions: return "invalid_dimensions";
        case Error::CacheDirCreationFailed: return "cache_dir_creation_failed";
        case Error::DecodeFailed: return "decode_failed";
        case Error::EncodeOrWriteFailed: return "encode_or_write_failed";
        case Error::TranscodeFailed: return "transcode_failed";
    }
    return "unknown";
}

ThumbnailError::ThumbnailError(const Error kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

}
