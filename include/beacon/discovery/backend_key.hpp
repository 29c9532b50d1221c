// beacon/include/beacon/discovery/backend_key.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace beacon::discovery {

/// @brief Number of random bytes behind each backend key.
inline constexpr std::size_t BACKEND_KEY_BYTES = 9;

using KeyGenerator = std::function<std::string()>;

/// @brief Mints a new backend key: BACKEND_KEY_BYTES bytes from the OpenSSL
/// CSPRNG, base64 encoded (12 characters, no padding needed).
/// @throws std::runtime_error if the random source fails.
std::string generate_backend_key();

}  // namespace beacon::discovery
