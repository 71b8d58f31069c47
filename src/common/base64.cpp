#include <junitgrader/common/base64.hpp>

#include <junitgrader/common/error_types.hpp>
#include <junitgrader/logging.hpp>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace junitgrader {

namespace iters = boost::archive::iterators;

std::string base64_encode(std::string_view data) {
    using EncodeIter = iters::base64_from_binary<iters::transform_width<std::string_view::const_iterator, 6, 8>>;

    std::string encoded(EncodeIter{data.begin()}, EncodeIter{data.end()});

    // Every 3 input bytes produce 4 output chars; pad the final group
    encoded.append((3 - data.size() % 3) % 3, '=');

    return encoded;
}

Result<std::string> base64_decode(std::string_view encoded) {
    using DecodeIter = iters::transform_width<iters::binary_from_base64<std::string::const_iterator>, 8, 6>;

    if (encoded.size() % 4 != 0) {
        LOG_DEBUG("Invalid base64 length {} (must be a multiple of 4)", encoded.size());
        return ErrorKind::BadArgument;
    }

    std::size_t padding = 0;
    while (padding < 2 && padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=') {
        ++padding;
    }

    // binary_from_base64 does not understand padding; decode it as zero bits and drop the extra bytes
    std::string input{encoded};
    input.replace(input.size() - padding, padding, padding, 'A');

    try {
        std::string decoded(DecodeIter{input.cbegin()}, DecodeIter{input.cend()});
        decoded.resize(decoded.size() - padding);

        return decoded;
    } catch (const iters::dataflow_exception& ex) {
        LOG_DEBUG("Invalid base64 data: {}", ex.what());
        return ErrorKind::BadArgument;
    }
}

} // namespace junitgrader
