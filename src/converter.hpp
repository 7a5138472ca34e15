#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "descriptor_builder.hpp"
#include "extended_key.hpp"
#include "script_kind.hpp"

namespace slipconv {

// Converter runs whole conversion requests. Every call either returns a
// complete result or throws ConvertError.
class Converter {
public:
    // SLIP-0132 or plain extended key to receive/change descriptors.
    //
    // Plain xpub/tpub/xprv/tprv keys become pkh() unless cosigners are given,
    // then sh(multi()). Multisig prefixes (Ypub, Zpub, ...) need cosigners and
    // a threshold; cosigner keys may use any prefix of the same network.
    static DescriptorPair key_to_descriptors(const std::string& key,
                                             const std::vector<std::string>& cosigners = {},
                                             unsigned threshold = 0,
                                             KeyOrdering ordering = KeyOrdering::Preserve);

    // Decoded Electrum wallet file to receive/change descriptors
    static DescriptorPair wallet_to_descriptors(const nlohmann::json& fields, KeyOrdering ordering);

    // Receive or change descriptor to Electrum wallet fields. Multisig
    // descriptors must use sortedmulti, the only ordering Electrum supports.
    static nlohmann::json descriptor_to_wallet(const std::string& descriptor);

    // Single-signature descriptor back to the SLIP-0132 key it came from
    static std::string descriptor_to_key(const std::string& descriptor);

    // Re-encodes key under the plain xpub/tpub/xprv/tprv version
    static std::string canonical_key(const ExtendedKey& key);

private:
    static std::vector<ExtendedKey> decode_descriptor_keys(const std::vector<std::string>& keys);
};

} // namespace slipconv
