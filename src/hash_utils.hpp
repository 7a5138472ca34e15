#pragma once

#include <array>
#include <span>
#include <cstdint>
#include <openssl/sha.h>
#include "consts.hpp"

namespace slipconv {

// HashUtils wraps the OpenSSL digests used by base58check
class HashUtils {
public:
    // Computes the SHA256 hash of input data
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> sha256(std::span<const uint8_t> data);

    // Computes double SHA256 hash (SHA256(SHA256(data)))
    static std::array<uint8_t, SHA256_DIGEST_LENGTH> double_sha256(std::span<const uint8_t> data);

    // First four bytes of the double SHA256 of data, as appended by base58check
    static std::array<uint8_t, CHECKSUM_SIZE> checksum(std::span<const uint8_t> data);

private:
    HashUtils() = delete;
};

} // namespace slipconv
