#pragma once

#include <string>
#include <string_view>

namespace pushfeed::signing {
    /// Lowercase hex HMAC-SHA256 of `payload` keyed with `secret`. Empty on OpenSSL failure.
    std::string hmacSha256Hex(std::string_view secret, std::string_view payload);
}
