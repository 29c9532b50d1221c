// beacon/src/discovery/backend_key.cpp
#include "beacon/discovery/backend_key.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <stdexcept>

namespace beacon::discovery {

std::string generate_backend_key() {
    std::array<unsigned char, BACKEND_KEY_BYTES> raw{};
    if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed: " +
                                 std::to_string(ERR_get_error()));
    }

    // 4 output characters per 3 input bytes, plus the terminating NUL
    std::array<unsigned char, (BACKEND_KEY_BYTES + 2) / 3 * 4 + 1> encoded{};
    int len = EVP_EncodeBlock(encoded.data(), raw.data(),
                              static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(encoded.data()),
                       static_cast<std::size_t>(len));
}

}  // namespace beacon::discovery
