#pragma once

#include <vector>
#include <span>
#include <cstdint>
#include "extended_key.hpp"
#include "error.hpp"

namespace slipconv {

// Utility class for the secp256k1 side of BIP32 extended keys
class Bip32Util {
public:
    // Derives a compressed public key from a 32-byte private scalar
    static std::vector<uint8_t> derive_public_key_from_private(std::span<const uint8_t> scalar);

    // Returns the neutered (public) counterpart of an extended private key, BIP32 N()
    static ExtendedKey to_public(const ExtendedKey& key);

    // True if key is 0x00 followed by a scalar in [1, n-1]
    static bool is_valid_private_key(std::span<const uint8_t> key);

    // True if key is a compressed point on secp256k1
    static bool is_valid_public_key(std::span<const uint8_t> key);
};

} // namespace slipconv
