// slipconv command line tool
//
// Converts an Electrum style extended key (xpub, ypub, zpub, Ypub, Zpub and the
// testnet and private variants) or an Electrum wallet file into the output
// descriptors of its receive and change branches, printed as a JSON array:
//
//   slipconv vpub5VXa...
//   ["wpkh(tpubD9Zj.../0/*)","wpkh(tpubD9Zj.../1/*)"]
//
// The reverse direction writes an Electrum wallet file for a descriptor:
//
//   slipconv --to-wallet "wpkh(tpubD9Zj.../0/*)" wallet.json

#include "converter.hpp"
#include "wallet_file.hpp"
#include "error.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace {

constexpr auto USAGE =
    "Usage:\n"
    "  slipconv [--multi] <extended-key | electrum-wallet-file>\n"
    "  slipconv --to-wallet <descriptor> <electrum-wallet-file>\n"
    "\n"
    "Multisig wallet files produce sortedmulti() descriptors, as Electrum sorts\n"
    "cosigner keys; --multi keeps the keystore order and emits multi().\n";

// Base58 key first; if that fails and the argument names a file, read it as
// an Electrum wallet. Otherwise the key error is the one worth reporting.
slipconv::DescriptorPair to_descriptors(const std::string& input, slipconv::KeyOrdering ordering) {
    try {
        return slipconv::Converter::key_to_descriptors(input);
    } catch (const slipconv::ConvertError&) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(input, ec)) {
            throw;
        }
    }

    auto fields = slipconv::WalletFileAdapter::load_from_file(input);
    return slipconv::Converter::wallet_to_descriptors(fields, ordering);
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.size() == 1 && (args[0] == "-h" || args[0] == "--help")) {
        std::cout << USAGE;
        return 0;
    }

    try {
        if (args.size() == 3 && args[0] == "--to-wallet") {
            auto fields = slipconv::Converter::descriptor_to_wallet(args[1]);
            slipconv::WalletFileAdapter::save_to_file(args[2], fields);
            return 0;
        }

        auto ordering = slipconv::KeyOrdering::Sorted;
        if (args.size() == 2 && args[0] == "--multi") {
            ordering = slipconv::KeyOrdering::Preserve;
            args.erase(args.begin());
        }
        if (args.size() != 1 || args[0].starts_with("--")) {
            std::cerr << USAGE;
            return 1;
        }

        auto descriptors = to_descriptors(args[0], ordering);
        std::cout << nlohmann::json::array({descriptors.receive, descriptors.change}).dump() << std::endl;
    } catch (const slipconv::ConvertError& e) {
        std::cerr << "Error (" << slipconv::error_type_name(e.type()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
