#include "hash_utils.hpp"
#include <algorithm>

namespace slipconv {

std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::sha256(std::span<const uint8_t> data) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> hash;
    // One-shot digest, writes into hash and returns hash.data()
    SHA256(data.data(), data.size(), hash.data());
    return hash;
}

std::array<uint8_t, SHA256_DIGEST_LENGTH> HashUtils::double_sha256(std::span<const uint8_t> data) {
    auto first_hash = sha256(data);
    return sha256(first_hash);
}

std::array<uint8_t, CHECKSUM_SIZE> HashUtils::checksum(std::span<const uint8_t> data) {
    auto hash = double_sha256(data);
    std::array<uint8_t, CHECKSUM_SIZE> result;
    std::copy_n(hash.begin(), CHECKSUM_SIZE, result.begin());
    return result;
}

} // namespace slipconv
