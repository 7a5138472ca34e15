#include "descriptor_parser.hpp"
#include "base58.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>

namespace slipconv {

namespace {

// sh(wsh(multi(...))) is the deepest supported nesting
constexpr size_t MAX_NESTING = 8;

[[noreturn]] void malformed(const std::string& message) {
    throw ConvertError(ConvertError::ErrorType::MalformedDescriptor, message);
}

[[noreturn]] void unsupported(const std::string& message) {
    throw ConvertError(ConvertError::ErrorType::UnsupportedDescriptorGrammar, message);
}

bool is_multi(const std::string& name) {
    return name == "multi" || name == "sortedmulti";
}

} // namespace

ParsedDescriptor DescriptorParser::parse(const std::string& text) {
    if (text.empty()) {
        malformed("Empty descriptor");
    }
    if (std::any_of(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); })) {
        malformed("Descriptor must not contain whitespace");
    }

    size_t pos = 0;
    Node root = parse_node(text, pos, 0);
    if (pos != text.size()) {
        malformed("Unexpected characters after position " + std::to_string(pos) + " in descriptor");
    }
    if (!root.is_call) {
        malformed("Descriptor must start with a script function");
    }

    const std::string& name = root.name;
    if (name != "pkh" && name != "wpkh" && name != "sh" && name != "wsh") {
        unsupported("Unsupported script function " + name + "()");
    }
    if (root.args.size() != 1) {
        malformed(name + "() takes exactly one argument");
    }
    const Node& inner = root.args.front();

    if (name == "pkh") {
        return parse_single(inner, ScriptType::P2pkh);
    }
    if (name == "wpkh") {
        return parse_single(inner, ScriptType::P2wpkh);
    }
    if (name == "wsh") {
        if (!inner.is_call || !is_multi(inner.name)) {
            unsupported("wsh() only supports multi() or sortedmulti()");
        }
        return parse_multi(inner, ScriptType::P2wshMultisig);
    }

    // sh(...)
    if (!inner.is_call) {
        unsupported("sh() of a bare key is not supported");
    }
    if (is_multi(inner.name)) {
        return parse_multi(inner, ScriptType::P2shMultisig);
    }
    if (inner.args.size() != 1 && (inner.name == "wpkh" || inner.name == "wsh")) {
        malformed(inner.name + "() takes exactly one argument");
    }
    if (inner.name == "wpkh") {
        return parse_single(inner.args.front(), ScriptType::P2shP2wpkh);
    }
    if (inner.name == "wsh") {
        const Node& script = inner.args.front();
        if (!script.is_call || !is_multi(script.name)) {
            unsupported("sh(wsh()) only supports multi() or sortedmulti()");
        }
        return parse_multi(script, ScriptType::P2shP2wshMultisig);
    }
    unsupported("sh(" + inner.name + "()) is not supported");
}

// Reads either NAME(ARG,...) or a bare argument starting at pos.
// On return pos points just past the node.
DescriptorParser::Node DescriptorParser::parse_node(std::string_view text, size_t& pos, size_t depth) {
    if (depth > MAX_NESTING) {
        malformed("Descriptor nesting is too deep");
    }

    size_t start = pos;
    while (pos < text.size() && text[pos] != '(' && text[pos] != ')' && text[pos] != ',') {
        ++pos;
    }

    Node node;
    node.name = std::string(text.substr(start, pos - start));

    if (pos < text.size() && text[pos] == '(') {
        if (node.name.empty()) {
            malformed("Missing function name before '('");
        }
        node.is_call = true;
        ++pos;
        while (true) {
            node.args.push_back(parse_node(text, pos, depth + 1));
            if (pos >= text.size()) {
                malformed("Unbalanced parentheses in descriptor");
            }
            if (text[pos] == ',') {
                ++pos;
            } else if (text[pos] == ')') {
                ++pos;
                break;
            } else {
                malformed("Unexpected '(' in descriptor");
            }
        }
    } else if (node.name.empty()) {
        malformed("Empty argument in descriptor");
    }

    return node;
}

ParsedDescriptor DescriptorParser::parse_single(const Node& key_node, ScriptType type) {
    if (key_node.is_call) {
        unsupported(std::string(script_type_name(type)) + " descriptor must wrap a key, not " +
            key_node.name + "()");
    }

    ParsedDescriptor result{ScriptKind::single(type), KeyOrdering::Preserve, {}, Branch::Unspecified};
    result.keys.push_back(parse_key(key_node.name, result.branch));
    return result;
}

ParsedDescriptor DescriptorParser::parse_multi(const Node& multi, ScriptType type) {
    KeyOrdering ordering = multi.name == "sortedmulti" ? KeyOrdering::Sorted : KeyOrdering::Preserve;
    if (multi.args.size() < 2) {
        malformed(multi.name + "() needs a threshold and at least one key");
    }

    const Node& threshold_node = multi.args.front();
    const std::string& digits = threshold_node.name;
    if (threshold_node.is_call || digits.empty() || digits.size() > 3 ||
        !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
        malformed("Multisig threshold '" + digits + "' is not a number");
    }
    if (digits.size() > 1 && digits.front() == '0') {
        malformed("Multisig threshold '" + digits + "' has a leading zero");
    }
    unsigned threshold = static_cast<unsigned>(std::stoul(digits));
    size_t signers = multi.args.size() - 1;

    if (threshold == 0 || threshold > signers || signers > MAX_MULTISIG_KEYS) {
        malformed("Invalid multisig threshold " + std::to_string(threshold) + " of " +
            std::to_string(signers) + " keys");
    }

    ParsedDescriptor result{
        ScriptKind::multisig(type, threshold, static_cast<unsigned>(signers)),
        ordering, {}, Branch::Unspecified
    };

    for (auto it = multi.args.begin() + 1; it != multi.args.end(); ++it) {
        if (it->is_call) {
            unsupported(multi.name + "() arguments must be keys, not " + it->name + "()");
        }
        Branch branch = Branch::Unspecified;
        result.keys.push_back(parse_key(it->name, branch));
        if (it != multi.args.begin() + 1 && branch != result.branch) {
            malformed("Multisig keys use different derivation branches");
        }
        result.branch = branch;
    }
    return result;
}

// KEY, KEY/0/* or KEY/1/*
std::string DescriptorParser::parse_key(const std::string& expression, Branch& branch) {
    auto slash = expression.find('/');
    std::string key = expression.substr(0, slash);
    std::string path = slash == std::string::npos ? "" : expression.substr(slash);

    if (key.empty() || !Base58::is_base58(key)) {
        malformed("Malformed key expression '" + expression + "'");
    }

    if (path.empty()) {
        branch = Branch::Unspecified;
    } else if (path == RECEIVE_SUFFIX) {
        branch = Branch::Receive;
    } else if (path == CHANGE_SUFFIX) {
        branch = Branch::Change;
    } else {
        malformed("Unsupported derivation '" + path + "', expected /0/* or /1/*");
    }
    return key;
}

} // namespace slipconv
