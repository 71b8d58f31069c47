#pragma once

#include <junitgrader/common/error_types.hpp>

#include <string>
#include <string_view>

namespace junitgrader {

/// Standard (RFC 4648) base64 with '=' padding
std::string base64_encode(std::string_view data);

/// Inverse of `base64_encode`. Fails with BadArgument on a length that is not a multiple of 4, or
/// on characters outside of the base64 alphabet.
Result<std::string> base64_decode(std::string_view encoded);

} // namespace junitgrader
