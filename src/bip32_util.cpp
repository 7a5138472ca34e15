#include "bip32_util.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <memory>
#include <algorithm>

namespace slipconv {

namespace {

using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using KeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;

GroupPtr secp256k1_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    if (!group) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial,
            "secp256k1 is not available in this OpenSSL build");
    }
    return group;
}

} // namespace

// Derives a public key from a private key using elliptic curve multiplication
// This implements the secp256k1 curve operation: public_key = private_key * G
//
// Compressed public key format:
// - First byte: 0x02 if y-coordinate is even, 0x03 if y-coordinate is odd
// - Remaining 32 bytes: x-coordinate
std::vector<uint8_t> Bip32Util::derive_public_key_from_private(std::span<const uint8_t> scalar) {
    KeyPtr ec_key(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!ec_key) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial, "Failed to create EC key");
    }

    BignumPtr priv_key(BN_bin2bn(scalar.data(), static_cast<int>(scalar.size()), nullptr), BN_free);
    if (!priv_key || !EC_KEY_set_private_key(ec_key.get(), priv_key.get())) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial, "Failed to load private key");
    }

    // pub = priv * G
    const EC_GROUP* group = EC_KEY_get0_group(ec_key.get());
    PointPtr pub_key(EC_POINT_new(group), EC_POINT_free);
    if (!pub_key || !EC_POINT_mul(group, pub_key.get(), priv_key.get(), nullptr, nullptr, nullptr)) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial, "Failed to compute public key");
    }

    std::vector<uint8_t> result(KEY_MATERIAL_SIZE);
    size_t size = EC_POINT_point2oct(
        group, pub_key.get(), POINT_CONVERSION_COMPRESSED,
        result.data(), result.size(), nullptr
    );
    if (size != KEY_MATERIAL_SIZE) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial, "Failed to serialize public key");
    }

    return result;
}

// Neutering keeps depth, fingerprint, child number and chain code; only the key
// material changes from 0x00 || k to the compressed point k * G.
ExtendedKey Bip32Util::to_public(const ExtendedKey& key) {
    if (!key.is_private()) {
        return key;
    }

    auto pubkey = derive_public_key_from_private(
        std::span<const uint8_t>(key.key).subspan(1, PRIVATE_SCALAR_SIZE));

    ExtendedKey result = key;
    result.kind = KeyKind::Public;
    std::copy(pubkey.begin(), pubkey.end(), result.key.begin());
    return result;
}

bool Bip32Util::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != KEY_MATERIAL_SIZE || key[0] != PRIVATE_KEY_PREFIX) {
        return false;
    }

    auto group = secp256k1_group();
    BignumPtr scalar(BN_bin2bn(key.data() + 1, PRIVATE_SCALAR_SIZE, nullptr), BN_free);
    if (!scalar) {
        return false;
    }

    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    return !BN_is_zero(scalar.get()) && BN_cmp(scalar.get(), order) < 0;
}

bool Bip32Util::is_valid_public_key(std::span<const uint8_t> key) {
    if (key.size() != KEY_MATERIAL_SIZE ||
        (key[0] != EVEN_PUBKEY_PREFIX && key[0] != ODD_PUBKEY_PREFIX)) {
        return false;
    }

    // oct2point rejects x-coordinates with no matching point on the curve
    auto group = secp256k1_group();
    PointPtr point(EC_POINT_new(group.get()), EC_POINT_free);
    return point && EC_POINT_oct2point(group.get(), point.get(), key.data(), key.size(), nullptr) == 1;
}

} // namespace slipconv
