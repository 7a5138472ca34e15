#pragma once

#include "extended_key.hpp"

namespace slipconv {

class KeyDeserializer {
public:
    // Deserialize a 74-byte body into an extended key of the given network and kind
    static ExtendedKey deserialize(const KeyBody& body, Network network, KeyKind kind);

    // Serialize an extended key into its 74-byte body
    static KeyBody serialize(const ExtendedKey& key);
};

} // namespace slipconv
