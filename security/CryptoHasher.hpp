#pragma once

#include <cstddef>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include <openssl/sha.h>

namespace security {

    class CryptoHasher {
        public:
            static std::string sha256(std::string_view input) {
                unsigned char hash[SHA256_DIGEST_LENGTH];
                SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
                std::ostringstream oss;
                for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
                    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
                }
                return oss.str();
            }

            // Short, log-safe stand-in for untrusted input.
            static std::string fingerprint(std::string_view input, std::size_t hex_digits = 16) {
                return sha256(input).substr(0, hex_digits);
            }
    };

} // namespace security
