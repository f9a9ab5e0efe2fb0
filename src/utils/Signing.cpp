#include "utils/Signing.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace pushfeed::signing {
    std::string hmacSha256Hex(std::string_view secret, std::string_view payload) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int len = 0;

        const unsigned char *out = HMAC(EVP_sha256(),
                                        secret.data(), static_cast<int>(secret.size()),
                                        reinterpret_cast<const unsigned char *>(payload.data()), payload.size(),
                                        digest, &len);
        if (!out) return {};

        static constexpr char kHex[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            hex.push_back(kHex[digest[i] >> 4]);
            hex.push_back(kHex[digest[i] & 0x0f]);
        }
        return hex;
    }
}
