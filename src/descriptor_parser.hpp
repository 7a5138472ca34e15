#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "script_kind.hpp"

namespace slipconv {

enum class Branch {
    Receive,      // /0/*
    Change,       // /1/*
    Unspecified   // bare key, no wildcard suffix
};

struct ParsedDescriptor {
    ScriptKind kind;
    KeyOrdering ordering;
    std::vector<std::string> keys;   // key strings without the branch suffix
    Branch branch;
};

// DescriptorParser is the inverse of DescriptorBuilder.
//
// It accepts exactly pkh(K), wpkh(K), sh(wpkh(K)), sh(M), wsh(M) and sh(wsh(M)),
// where M is multi(m,K,...) or sortedmulti(m,K,...) and K is an extended key
// optionally followed by /0/* or /1/*.
class DescriptorParser {
public:
    // Throws ConvertError(UnsupportedDescriptorGrammar | MalformedDescriptor)
    static ParsedDescriptor parse(const std::string& text);

private:
    // One function call or bare argument of the descriptor expression tree
    struct Node {
        std::string name;          // function name, or argument text for leaves
        std::vector<Node> args;
        bool is_call = false;
    };

    static Node parse_node(std::string_view text, size_t& pos, size_t depth);
    static ParsedDescriptor parse_single(const Node& key_node, ScriptType type);
    static ParsedDescriptor parse_multi(const Node& multi, ScriptType type);
    static std::string parse_key(const std::string& expression, Branch& branch);
};

} // namespace slipconv
