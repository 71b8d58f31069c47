#pragma once

#include "output/sink.hpp"

#include <iostream>
#include <ostream>

namespace junitgrader {

/// Writes to a std::ostream (stdout unless told otherwise)
class StreamSink : public Sink
{
public:
    explicit StreamSink(std::ostream& stream = std::cout)
        : stream_{&stream} {}

    void write(std::string_view str) override;
    void flush() override;

    ~StreamSink() override = default;

private:
    std::ostream* stream_;
};

} // namespace junitgrader
