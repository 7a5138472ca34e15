#include "script_kind.hpp"
#include "consts.hpp"
#include "error.hpp"

namespace slipconv {

bool is_multisig(ScriptType type) {
    switch (type) {
        case ScriptType::P2shMultisig:
        case ScriptType::P2shP2wshMultisig:
        case ScriptType::P2wshMultisig:
            return true;
        case ScriptType::P2pkh:
        case ScriptType::P2shP2wpkh:
        case ScriptType::P2wpkh:
            return false;
    }
    return false;
}

ScriptKind ScriptKind::single(ScriptType type) {
    if (slipconv::is_multisig(type)) {
        throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
            std::string("Script type ") + script_type_name(type) + " needs a threshold and signer count");
    }
    return ScriptKind{type, 0, 0};
}

ScriptKind ScriptKind::multisig(ScriptType type, unsigned threshold, unsigned signers) {
    if (!slipconv::is_multisig(type)) {
        throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
            std::string("Script type ") + script_type_name(type) + " is not a multisig type");
    }
    if (threshold == 0 || threshold > signers || signers > MAX_MULTISIG_KEYS) {
        throw ConvertError(ConvertError::ErrorType::InvalidMultisigParameters,
            "Invalid multisig parameters " + std::to_string(threshold) + " of " + std::to_string(signers));
    }
    return ScriptKind{type, threshold, signers};
}

bool ScriptKind::is_multisig() const {
    return slipconv::is_multisig(type);
}

const char* script_type_name(ScriptType type) {
    switch (type) {
        case ScriptType::P2pkh: return "p2pkh";
        case ScriptType::P2shP2wpkh: return "p2wpkh-p2sh";
        case ScriptType::P2wpkh: return "p2wpkh";
        case ScriptType::P2shMultisig: return "p2sh";
        case ScriptType::P2shP2wshMultisig: return "p2wsh-p2sh";
        case ScriptType::P2wshMultisig: return "p2wsh";
    }
    return "unknown";
}

std::optional<ScriptType> script_type_from_name(const std::string& name) {
    for (auto type : {ScriptType::P2pkh, ScriptType::P2shP2wpkh, ScriptType::P2wpkh,
                      ScriptType::P2shMultisig, ScriptType::P2shP2wshMultisig, ScriptType::P2wshMultisig}) {
        if (name == script_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace slipconv
