#pragma once

#include "output/sink.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace junitgrader {

/// Appends everything written to a file, the way GitHub Actions expects `$GITHUB_OUTPUT` to be
/// written. Data is buffered and appended to the file on `flush()` (and on destruction).
class FileAppendSink : public Sink
{
public:
    explicit FileAppendSink(std::filesystem::path path);

    void write(std::string_view str) override;

    /// Throws std::system_error if the file cannot be opened or written
    void flush() override;

    ~FileAppendSink() override;

    const std::filesystem::path& get_path() const { return path_; }

private:
    std::filesystem::path path_;
    std::string buffer_;
};

} // namespace junitgrader
