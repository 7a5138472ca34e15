#pragma once

#include <optional>
#include "extended_key.hpp"
#include "script_kind.hpp"

namespace slipconv {

// What a version prefix says about the key that carries it
struct VersionEntry {
    Network network;
    std::optional<ScriptType> script_type;   // empty for plain xpub/tpub/xprv/tprv
    KeyKind key_kind;
};

// VersionByteTable maps SLIP-0132 and BIP32 version prefixes to their meaning.
//
// The mapping is a constant table, not a formula. Plain xpub/tpub/xprv/tprv
// name no script type; every SLIP-0132 prefix names exactly one, so the reverse
// direction is only defined for script types that have a SLIP-0132 prefix.
class VersionByteTable {
public:
    // Throws ConvertError(UnknownVersionByte) for prefixes not in the table
    static VersionEntry lookup(const VersionBytes& version);

    // Throws ConvertError(NoCanonicalVersion) if no SLIP-0132 prefix exists
    static VersionBytes reverse_lookup(Network network, ScriptType type, KeyKind key_kind);

    // Generic xpub/tpub/xprv/tprv prefix for the network and key kind of version
    static VersionBytes canonicalize(const VersionBytes& version);

    static VersionBytes generic_version(Network network, KeyKind key_kind);

private:
    VersionByteTable() = delete;
};

} // namespace slipconv
