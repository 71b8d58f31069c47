#include "output/stream_sink.hpp"

#include <ostream>
#include <string_view>

namespace junitgrader {

void StreamSink::write(std::string_view str) {
    *stream_ << str;
}

void StreamSink::flush() {
    stream_->flush();
}

} // namespace junitgrader
