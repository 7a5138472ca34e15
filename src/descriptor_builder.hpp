#pragma once

#include <string>
#include <vector>
#include "script_kind.hpp"

namespace slipconv {

// Receive (/0/*) and change (/1/*) descriptors of one conversion
struct DescriptorPair {
    std::string receive;
    std::string change;
};

class DescriptorBuilder {
public:
    // Builds both branch descriptors for key wrapped as kind.
    //
    // key and cosigners must be generic (xpub/tpub/xprv/tprv) key strings.
    // For multisig kinds, cosigners must hold exactly signers - 1 keys; they are
    // embedded after key in the given order.
    // Throws ConvertError(MissingCosignerKey | InvalidMultisigParameters)
    static DescriptorPair build(const std::string& key, const ScriptKind& kind,
                                const std::vector<std::string>& cosigners = {},
                                KeyOrdering ordering = KeyOrdering::Preserve);

private:
    static std::string build_branch(const std::vector<std::string>& keys, const ScriptKind& kind,
                                    KeyOrdering ordering, const std::string& suffix);
};

} // namespace slipconv
