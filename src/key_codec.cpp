#include "key_codec.hpp"
#include "base58.hpp"
#include "hash_utils.hpp"
#include "key_deserializer.hpp"
#include "version_table.hpp"
#include "hex_utils.hpp"
#include "error.hpp"
#include <algorithm>
#include <vector>

namespace slipconv {

// Decodes a base58check extended key.
//
// Layout of the 82 decoded bytes:
//   version(4) | depth(1) | fingerprint(4) | child(4) | chaincode(32) | key(33) | checksum(4)
// The checksum is the first four bytes of SHA256(SHA256(first 78 bytes)).
DecodedKey KeyCodec::decode(const std::string& encoded) {
    auto data = Base58::decode(encoded);
    if (data.size() != ENCODED_KEY_SIZE) {
        throw ConvertError(ConvertError::ErrorType::InvalidLength,
            "Decoded extended key is " + std::to_string(data.size()) + " bytes, expected " +
            std::to_string(ENCODED_KEY_SIZE));
    }

    auto payload = std::span<const uint8_t>(data).first(SERIALIZED_KEY_SIZE);
    auto expected = HashUtils::checksum(payload);
    if (!std::equal(expected.begin(), expected.end(), data.begin() + SERIALIZED_KEY_SIZE)) {
        throw ConvertError(ConvertError::ErrorType::InvalidChecksum, "Extended key checksum mismatch");
    }

    DecodedKey result;
    std::copy_n(data.begin(), VERSION_SIZE, result.version.begin());
    std::copy_n(data.begin() + VERSION_SIZE, KEY_BODY_SIZE, result.body.begin());
    return result;
}

std::string KeyCodec::encode(const VersionBytes& version, const KeyBody& body) {
    std::vector<uint8_t> data;
    data.reserve(ENCODED_KEY_SIZE);
    data.insert(data.end(), version.begin(), version.end());
    data.insert(data.end(), body.begin(), body.end());

    auto checksum = HashUtils::checksum(data);
    data.insert(data.end(), checksum.begin(), checksum.end());
    return Base58::encode(data);
}

ExtendedKey KeyCodec::decode_key(const std::string& encoded) {
    auto decoded = decode(encoded);
    auto entry = VersionByteTable::lookup(decoded.version);
    return KeyDeserializer::deserialize(decoded.body, entry.network, entry.key_kind);
}

std::string KeyCodec::encode_key(const VersionBytes& version, const ExtendedKey& key) {
    auto entry = VersionByteTable::lookup(version);
    if (entry.network != key.network || entry.key_kind != key.kind) {
        throw ConvertError(ConvertError::ErrorType::InvalidKeyMaterial,
            "Version 0x" + HexUtils::encode(version) + " does not match the key's network or kind");
    }
    return encode(version, KeyDeserializer::serialize(key));
}

} // namespace slipconv
