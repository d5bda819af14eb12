#include "util/Magic.hpp"

#include <stdexcept>

using namespace cc::util;

Magic::Magic(const int flags) : cookie_(magic_open(flags), &magic_close) {
    if (!cookie_) throw std::runtime_error("magic_open failed");

    // default compiled-in database
    if (magic_load(cookie_.get(), nullptr) != 0)
        throw std::runtime_error("Failed to load magic database: " + lastError("unknown error"));
}

std::string Magic::mime_type(const std::filesystem::path& path) const {
    if (path.empty()) throw std::invalid_argument("Cannot sniff the MIME type of an empty path");

    const char* result = magic_file(cookie_.get(), path.c_str());
    if (!result) throw std::runtime_error("Cannot sniff " + path.string() + ": " + lastError("magic_file failed"));

    return result;
}

std::string Magic::lastError(const std::string& fallback) const {
    const char* err = magic_error(cookie_.get());
    return err ? err : fallback;
}

std::string Magic::get_mime_type(const std::string& path) {
    thread_local const Magic instance;
    return instance.mime_type(path);
}
