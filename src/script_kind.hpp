#pragma once

#include <string>
#include <optional>

namespace slipconv {

// Script templates an extended key can be destined for
enum class ScriptType {
    P2pkh,
    P2shP2wpkh,
    P2wpkh,
    P2shMultisig,
    P2shP2wshMultisig,
    P2wshMultisig
};

// Whether multisig descriptors keep the caller's key order (multi) or let the
// script sort the derived public keys (sortedmulti). The two produce different
// scripts, so it is always chosen explicitly.
enum class KeyOrdering {
    Preserve,
    Sorted
};

// A script type together with its multisig parameters.
// threshold (m) and signers (n) are zero for single-signature types.
struct ScriptKind {
    ScriptType type;
    unsigned threshold = 0;
    unsigned signers = 0;

    static ScriptKind single(ScriptType type);

    // Throws ConvertError(InvalidMultisigParameters) unless 1 <= m <= n <= 255
    static ScriptKind multisig(ScriptType type, unsigned threshold, unsigned signers);

    bool is_multisig() const;

    bool operator==(const ScriptKind&) const = default;
};

bool is_multisig(ScriptType type);

// Electrum txin_type name: p2pkh, p2wpkh-p2sh, p2wpkh, p2sh, p2wsh-p2sh, p2wsh
const char* script_type_name(ScriptType type);

std::optional<ScriptType> script_type_from_name(const std::string& name);

} // namespace slipconv
