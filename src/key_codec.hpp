#pragma once

#include <string>
#include "extended_key.hpp"

namespace slipconv {

// Version prefix and body of a base58check extended key
struct DecodedKey {
    VersionBytes version;
    KeyBody body;
};

// KeyCodec converts between the base58check text of an extended key and its
// 78-byte serialization. It does not interpret the version bytes.
class KeyCodec {
public:
    // Throws ConvertError(InvalidBase58 | InvalidLength | InvalidChecksum)
    static DecodedKey decode(const std::string& encoded);

    static std::string encode(const VersionBytes& version, const KeyBody& body);

    // decode() followed by a version table lookup and body deserialization
    static ExtendedKey decode_key(const std::string& encoded);

    // Encodes key under an explicit version prefix
    static std::string encode_key(const VersionBytes& version, const ExtendedKey& key);

private:
    KeyCodec() = delete;
};

} // namespace slipconv
