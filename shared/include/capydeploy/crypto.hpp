/**
 * CapyDeploy - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace capydeploy::crypto
{

    void ensure_sodium_init();

    // Hex-encoded generic hash (BLAKE2b) of a byte range.
    std::string hash_bytes(std::span<const std::byte> data);

    // Hex-encoded string of `byte_count` bytes from the system CSPRNG.
    std::string random_hex(std::size_t byte_count);

} // namespace capydeploy::crypto
