#include "output/file_append_sink.hpp"

#include <junitgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <cerrno>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace junitgrader {

FileAppendSink::FileAppendSink(std::filesystem::path path)
    : path_{std::move(path)} {}

void FileAppendSink::write(std::string_view str) {
    buffer_ += str;
}

void FileAppendSink::flush() {
    if (buffer_.empty()) {
        return;
    }

    std::ofstream file{path_, std::ios::out | std::ios::app | std::ios::binary};

    if (!file) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), fmt::format("Could not open {} for appending", path_));
    }

    file.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    file.flush();

    if (!file) {
        const int err = errno;
        throw std::system_error(err, std::generic_category(), fmt::format("Could not write to {}", path_));
    }

    LOG_DEBUG("Appended {} bytes to {}", buffer_.size(), path_);
    buffer_.clear();
}

FileAppendSink::~FileAppendSink() {
    if (buffer_.empty()) {
        return;
    }

    try {
        flush();
    } catch (const std::exception& ex) {
        LOG_ERROR("Discarding {} unwritten bytes: {}", buffer_.size(), ex.what());
    }
}

} // namespace junitgrader
