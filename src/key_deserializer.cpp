#include "key_deserializer.hpp"
#include "bip32_util.hpp"
#include "error.hpp"
#include <algorithm>

namespace slipconv {

// Deserialize a body into an extended key.
// Args: body - depth(1) fingerprint(4) child(4) chaincode(32) key(33)
// Returns: The deserialized extended key
// Throws: ConvertError(InvalidKeyMaterial) if the key material does not match
//         the key kind or is not a valid secp256k1 key
ExtendedKey KeyDeserializer::deserialize(const KeyBody& body, Network network, KeyKind kind) {
    ExtendedKey key;
    key.network = network;
    key.kind = kind;
    key.depth = body[DEPTH_OFFSET];
    std::copy_n(body.begin() + FINGERPRINT_OFFSET, FINGERPRINT_SIZE, key.finger_print.begin());
    std::copy_n(body.begin() + CHILD_NUMBER_OFFSET, CHILD_NUMBER_SIZE, key.child_number.begin());
    std::copy_n(body.begin() + CHAINCODE_OFFSET, CHAINCODE_SIZE, key.chaincode.begin());
    std::copy_n(body.begin() + KEY_OFFSET, KEY_MATERIAL_SIZE, key.key.begin());

    if (kind == KeyKind::Private) {
        if (key.key[0] != PRIVATE_KEY_PREFIX || !Bip32Util::is_valid_private_key(key.key)) {
            throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial,
                "Extended private key does not hold a valid secp256k1 scalar");
        }
    } else if (!Bip32Util::is_valid_public_key(key.key)) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial,
            "Extended public key does not hold a valid compressed secp256k1 point");
    }

    return key;
}

KeyBody KeyDeserializer::serialize(const ExtendedKey& key) {
    KeyBody body;
    body[DEPTH_OFFSET] = key.depth;
    std::copy(key.finger_print.begin(), key.finger_print.end(), body.begin() + FINGERPRINT_OFFSET);
    std::copy(key.child_number.begin(), key.child_number.end(), body.begin() + CHILD_NUMBER_OFFSET);
    std::copy(key.chaincode.begin(), key.chaincode.end(), body.begin() + CHAINCODE_OFFSET);
    std::copy(key.key.begin(), key.key.end(), body.begin() + KEY_OFFSET);
    return body;
}

} // namespace slipconv
