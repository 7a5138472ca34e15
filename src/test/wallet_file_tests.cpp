#include <boost/test/unit_test.hpp>

#include "wallet_file.hpp"
#include "key_codec.hpp"
#include "bip32_util.hpp"
#include "test_keys.hpp"
#include "util.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace slipconv;
using ErrorType = ConvertError::ErrorType;
using json = nlohmann::json;

namespace {

json keystore(const char* xpub, const char* xprv = nullptr) {
    json result = {{"type", "bip32"}, {"xpub", xpub}, {"xprv", nullptr}};
    if (xprv) {
        result["xprv"] = xprv;
    }
    return result;
}

json standard_wallet(json store) {
    return {{"wallet_type", "standard"}, {"keystore", std::move(store)}};
}

json multisig_wallet(const std::string& wallet_type, std::vector<json> stores) {
    json fields = {{"wallet_type", wallet_type}};
    for (size_t i = 0; i < stores.size(); ++i) {
        fields["x" + std::to_string(i + 1) + "/"] = std::move(stores[i]);
    }
    return fields;
}

json segwit_multisig_wallet() {
    return multisig_wallet("2of2", {
        keystore(test_keys::MULTI_SEGWIT_VPUB1, test_keys::MULTI_SEGWIT_VPRV),
        keystore(test_keys::MULTI_SEGWIT_VPUB2)
    });
}

// Temporary file removed when the fixture goes out of scope
struct TempFile {
    std::filesystem::path path;

    explicit TempFile(const std::string& name)
        : path(std::filesystem::temp_directory_path() / name) {}
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

BOOST_AUTO_TEST_SUITE(wallet_file_tests)

BOOST_AUTO_TEST_CASE(parse_standard_legacy_wallet)
{
    auto fields = standard_wallet(keystore(test_keys::LEGACY_TPUB, test_keys::LEGACY_TPRV));
    fields["addresses"] = {{"receiving", json::array()}, {"change", json::array()}};

    auto contents = WalletFileAdapter::parse(fields);
    BOOST_CHECK(contents.kind == ScriptKind::single(ScriptType::P2pkh));
    BOOST_CHECK(contents.key == KeyCodec::decode_key(test_keys::LEGACY_TPRV));
    BOOST_CHECK(contents.cosigners.empty());
}

BOOST_AUTO_TEST_CASE(parse_watch_only_wallet)
{
    auto contents = WalletFileAdapter::parse(standard_wallet(keystore(test_keys::SEGWIT_VPUB)));
    BOOST_CHECK(contents.kind == ScriptKind::single(ScriptType::P2wpkh));
    BOOST_CHECK(!contents.key.is_private());
    BOOST_CHECK(contents.key == KeyCodec::decode_key(test_keys::SEGWIT_TPUB));

    // Hardware keystores carry an xpub just like bip32 ones
    auto hardware = keystore(test_keys::LEGACY_TPUB);
    hardware["type"] = "hardware";
    hardware.erase("xprv");
    BOOST_CHECK(WalletFileAdapter::parse(standard_wallet(hardware)).kind.type == ScriptType::P2pkh);
}

BOOST_AUTO_TEST_CASE(parse_segwit_wallet)
{
    auto contents = WalletFileAdapter::parse(
        standard_wallet(keystore(test_keys::SEGWIT_VPUB, test_keys::SEGWIT_VPRV)));
    BOOST_CHECK(contents.kind == ScriptKind::single(ScriptType::P2wpkh));
    BOOST_CHECK(contents.key == KeyCodec::decode_key(test_keys::SEGWIT_TPRV));
}

BOOST_AUTO_TEST_CASE(txin_type_names_script_of_plain_keys)
{
    auto fields = standard_wallet(keystore(test_keys::SEGWIT_TPUB, test_keys::SEGWIT_TPRV));
    fields["txin_type"] = "p2wpkh";
    BOOST_CHECK(WalletFileAdapter::parse(fields).kind == ScriptKind::single(ScriptType::P2wpkh));

    fields["txin_type"] = "p2wpkh-p2sh";
    BOOST_CHECK(WalletFileAdapter::parse(fields).kind == ScriptKind::single(ScriptType::P2shP2wpkh));

    // A SLIP-0132 prefix has to agree with txin_type
    auto slip = standard_wallet(keystore(test_keys::SEGWIT_VPUB, test_keys::SEGWIT_VPRV));
    slip["txin_type"] = "p2wpkh-p2sh";
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(slip), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));

    slip["txin_type"] = "p2wsh";
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(slip), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));

    slip["txin_type"] = "p2tr";
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(slip), ConvertError,
                          test::is_error(ErrorType::UnsupportedWalletType));
}

BOOST_AUTO_TEST_CASE(parse_segwit_multisig_wallet)
{
    auto contents = WalletFileAdapter::parse(segwit_multisig_wallet());
    BOOST_CHECK(contents.kind == ScriptKind::multisig(ScriptType::P2wshMultisig, 2, 2));
    BOOST_CHECK(contents.key == KeyCodec::decode_key(test_keys::MULTI_SEGWIT_TPRV));
    BOOST_REQUIRE_EQUAL(contents.cosigners.size(), 1U);
    BOOST_CHECK(contents.cosigners[0] == KeyCodec::decode_key(test_keys::MULTI_SEGWIT_TPUB2));
}

BOOST_AUTO_TEST_CASE(parse_legacy_multisig_wallet)
{
    auto contents = WalletFileAdapter::parse(multisig_wallet("2of2", {
        keystore(test_keys::MULTI_LEGACY_TPUB1, test_keys::MULTI_LEGACY_TPRV),
        keystore(test_keys::LEGACY_TPUB)
    }));
    BOOST_CHECK(contents.kind == ScriptKind::multisig(ScriptType::P2shMultisig, 2, 2));
    BOOST_CHECK(contents.key.is_private());
    BOOST_CHECK(contents.cosigners[0] == KeyCodec::decode_key(test_keys::LEGACY_TPUB));
}

BOOST_AUTO_TEST_CASE(parse_wrapped_multisig_keeps_keystore_order)
{
    // Field order in the JSON object does not decide cosigner order
    json fields = {
        {"x3/", keystore(test_keys::WRAPPED_UPUB3)},
        {"x1/", keystore(test_keys::WRAPPED_UPUB1)},
        {"wallet_type", "3of3"},
        {"x2/", keystore(test_keys::WRAPPED_UPUB2)}
    };

    auto contents = WalletFileAdapter::parse(fields);
    BOOST_CHECK(contents.kind == ScriptKind::multisig(ScriptType::P2shP2wshMultisig, 3, 3));
    BOOST_CHECK(contents.key == KeyCodec::decode_key(test_keys::WRAPPED_TPUB1));
    BOOST_REQUIRE_EQUAL(contents.cosigners.size(), 2U);
    BOOST_CHECK(contents.cosigners[0] == KeyCodec::decode_key(test_keys::WRAPPED_TPUB2));
    BOOST_CHECK(contents.cosigners[1] == KeyCodec::decode_key(test_keys::WRAPPED_TPUB3));
}

BOOST_AUTO_TEST_CASE(multisig_keystore_count_must_match)
{
    auto missing = multisig_wallet("2of3", {
        keystore(test_keys::WRAPPED_UPUB1), keystore(test_keys::WRAPPED_UPUB2)
    });
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(missing), ConvertError,
                          test::is_error(ErrorType::MissingCosignerKey));

    auto extra = multisig_wallet("2of2", {
        keystore(test_keys::WRAPPED_UPUB1), keystore(test_keys::WRAPPED_UPUB2), keystore(test_keys::WRAPPED_UPUB3)
    });
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(extra), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));

    // keystore indexes must be exactly x1/ .. xn/
    json gap = {
        {"wallet_type", "2of3"},
        {"x1/", keystore(test_keys::WRAPPED_UPUB1)},
        {"x3/", keystore(test_keys::WRAPPED_UPUB3)}
    };
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(gap), ConvertError,
                          test::is_error(ErrorType::MissingCosignerKey));

    json out_of_range = {
        {"wallet_type", "2of2"},
        {"x1/", keystore(test_keys::WRAPPED_UPUB1)},
        {"x7/", keystore(test_keys::WRAPPED_UPUB2)}
    };
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(out_of_range), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));

    json zero_padded = {
        {"wallet_type", "2of2"},
        {"x1/", keystore(test_keys::WRAPPED_UPUB1)},
        {"x02/", keystore(test_keys::WRAPPED_UPUB2)}
    };
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(zero_padded), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));
}

BOOST_AUTO_TEST_CASE(reject_unsupported_wallet_types)
{
    for (const auto* type : {"imported", "old", "2fa", "xof2", "2of", "of2"}) {
        auto fields = standard_wallet(keystore(test_keys::LEGACY_TPUB));
        fields["wallet_type"] = type;
        BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(fields), ConvertError,
                              test::is_error(ErrorType::UnsupportedWalletType));
    }

    auto old_keystore = keystore(test_keys::LEGACY_TPUB);
    old_keystore["type"] = "old";
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(standard_wallet(old_keystore)), ConvertError,
                          test::is_error(ErrorType::UnsupportedWalletType));
}

BOOST_AUTO_TEST_CASE(reject_invalid_wallet_files)
{
    auto check_invalid = [](const json& fields) {
        BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(fields), ConvertError,
                              test::is_error(ErrorType::InvalidWalletFile));
    };

    check_invalid(json::array());
    check_invalid(json{{"wallet_type", "standard"}});
    check_invalid(json{{"wallet_type", 1}, {"keystore", keystore(test_keys::LEGACY_TPUB)}});
    check_invalid(standard_wallet("xpub"));
    check_invalid(standard_wallet(json{{"type", "bip32"}}));
    check_invalid(standard_wallet(json{{"type", "bip32"}, {"xpub", 5}}));

    // xpub that is not the public half of xprv
    check_invalid(standard_wallet(keystore(test_keys::SEGWIT_TPUB, test_keys::LEGACY_TPRV)));
    // xpub prefix for another script type than its xprv
    check_invalid(standard_wallet(keystore(test_keys::SEGWIT_TPUB, test_keys::SEGWIT_VPRV)));
    // public key in the xprv field
    check_invalid(standard_wallet(keystore(test_keys::LEGACY_TPUB, test_keys::LEGACY_TPUB)));

    // multisig prefix in a standard wallet and the other way round
    check_invalid(standard_wallet(keystore(test_keys::MULTI_SEGWIT_VPUB2)));
    check_invalid(multisig_wallet("1of1", {keystore(test_keys::SEGWIT_VPUB)}));

    // cosigners for different scripts or networks
    check_invalid(multisig_wallet("2of2", {
        keystore(test_keys::MULTI_SEGWIT_VPUB1), keystore(test_keys::WRAPPED_UPUB2)
    }));
    check_invalid(multisig_wallet("2of2", {
        keystore(test_keys::MULTI_LEGACY_TPUB1), keystore(test_keys::SLIP_XPUB)
    }));

    check_invalid(multisig_wallet("0of2", {
        keystore(test_keys::WRAPPED_UPUB1), keystore(test_keys::WRAPPED_UPUB2)
    }));
    check_invalid(multisig_wallet("3of2", {
        keystore(test_keys::WRAPPED_UPUB1), keystore(test_keys::WRAPPED_UPUB2)
    }));
}

BOOST_AUTO_TEST_CASE(key_errors_propagate)
{
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(standard_wallet(keystore(test_keys::SHORT_KEY))),
                          ConvertError, test::is_error(ErrorType::InvalidLength));
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::parse(standard_wallet(keystore(test_keys::OFF_CURVE_TPUB))),
                          ConvertError, test::is_error(ErrorType::InvalidKeyMaterial));
}

BOOST_AUTO_TEST_CASE(build_writes_electrum_prefixes)
{
    auto segwit = WalletFileAdapter::build(KeyCodec::decode_key(test_keys::SEGWIT_TPRV),
                                           ScriptKind::single(ScriptType::P2wpkh));
    BOOST_CHECK_EQUAL(segwit["wallet_type"].get<std::string>(), "standard");
    BOOST_CHECK_EQUAL(segwit["keystore"]["type"].get<std::string>(), "bip32");
    BOOST_CHECK_EQUAL(segwit["keystore"]["xprv"].get<std::string>(), test_keys::SEGWIT_VPRV);
    BOOST_CHECK_EQUAL(segwit["keystore"]["xpub"].get<std::string>(), test_keys::SEGWIT_VPUB);
    BOOST_CHECK(segwit["addresses"]["receiving"].empty());

    auto legacy = WalletFileAdapter::build(KeyCodec::decode_key(test_keys::LEGACY_TPUB),
                                           ScriptKind::single(ScriptType::P2pkh));
    BOOST_CHECK_EQUAL(legacy["keystore"]["xpub"].get<std::string>(), test_keys::LEGACY_TPUB);
    BOOST_CHECK(legacy["keystore"]["xprv"].is_null());

    auto multisig = WalletFileAdapter::build(KeyCodec::decode_key(test_keys::MULTI_SEGWIT_TPRV),
                                             ScriptKind::multisig(ScriptType::P2wshMultisig, 2, 2),
                                             {KeyCodec::decode_key(test_keys::MULTI_SEGWIT_TPUB2)});
    BOOST_CHECK_EQUAL(multisig["wallet_type"].get<std::string>(), "2of2");
    BOOST_CHECK_EQUAL(multisig["x1/"]["xprv"].get<std::string>(), test_keys::MULTI_SEGWIT_VPRV);
    BOOST_CHECK_EQUAL(multisig["x1/"]["xpub"].get<std::string>(), test_keys::MULTI_SEGWIT_VPUB1);
    BOOST_CHECK_EQUAL(multisig["x2/"]["xpub"].get<std::string>(), test_keys::MULTI_SEGWIT_VPUB2);
    BOOST_CHECK(!multisig.contains("keystore"));
}

BOOST_AUTO_TEST_CASE(build_then_parse_returns_same_contents)
{
    auto key = KeyCodec::decode_key(test_keys::WRAPPED_TPUB1);
    std::vector<ExtendedKey> cosigners{
        KeyCodec::decode_key(test_keys::WRAPPED_TPUB2), KeyCodec::decode_key(test_keys::WRAPPED_TPUB3)
    };
    auto kind = ScriptKind::multisig(ScriptType::P2shP2wshMultisig, 2, 3);

    auto contents = WalletFileAdapter::parse(WalletFileAdapter::build(key, kind, cosigners));
    BOOST_CHECK(contents.key == key);
    BOOST_CHECK(contents.kind == kind);
    BOOST_CHECK(contents.cosigners == cosigners);

    BOOST_CHECK_EXCEPTION(WalletFileAdapter::build(key, kind, {cosigners[0]}), ConvertError,
                          test::is_error(ErrorType::MissingCosignerKey));
}

BOOST_AUTO_TEST_CASE(save_and_load_file)
{
    TempFile file("slipconv_wallet_test.json");
    auto fields = segwit_multisig_wallet();

    WalletFileAdapter::save_to_file(file.path.string(), fields);
    BOOST_CHECK(WalletFileAdapter::load_from_file(file.path.string()) == fields);
}

BOOST_AUTO_TEST_CASE(load_reports_io_and_format_errors)
{
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::load_from_file("/nonexistent/slipconv/wallet"), ConvertError,
                          test::is_error(ErrorType::IoError));

    TempFile file("slipconv_encrypted_wallet_test");
    {
        std::ofstream out(file.path);
        out << "QklFMQKZ0nLQpCMWxbTfHgW";
    }
    BOOST_CHECK_EXCEPTION(WalletFileAdapter::load_from_file(file.path.string()), ConvertError,
                          test::is_error(ErrorType::InvalidWalletFile));
}

BOOST_AUTO_TEST_SUITE_END()
