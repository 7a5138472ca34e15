#include <boost/test/unit_test.hpp>

#include "version_table.hpp"
#include "key_codec.hpp"
#include "hex_utils.hpp"
#include "util.hpp"

using namespace slipconv;
using ErrorType = ConvertError::ErrorType;

namespace {

VersionBytes version(const std::string& hex) {
    auto bytes = HexUtils::decode(hex);
    return VersionBytes{bytes[0], bytes[1], bytes[2], bytes[3]};
}

} // namespace

BOOST_AUTO_TEST_SUITE(version_table_tests)

BOOST_AUTO_TEST_CASE(lookup_slip132_prefixes)
{
    auto vpub = VersionByteTable::lookup(version("045f1cf6"));
    BOOST_CHECK(vpub.network == Network::Testnet);
    BOOST_CHECK(vpub.script_type == ScriptType::P2wpkh);
    BOOST_CHECK(vpub.key_kind == KeyKind::Public);

    auto yprv = VersionByteTable::lookup(version("049d7878"));
    BOOST_CHECK(yprv.network == Network::Mainnet);
    BOOST_CHECK(yprv.script_type == ScriptType::P2shP2wpkh);
    BOOST_CHECK(yprv.key_kind == KeyKind::Private);

    auto Zpub = VersionByteTable::lookup(version("02aa7ed3"));
    BOOST_CHECK(Zpub.script_type == ScriptType::P2wshMultisig);

    auto Uprv = VersionByteTable::lookup(version("024285b5"));
    BOOST_CHECK(Uprv.network == Network::Testnet);
    BOOST_CHECK(Uprv.script_type == ScriptType::P2shP2wshMultisig);
    BOOST_CHECK(Uprv.key_kind == KeyKind::Private);
}

BOOST_AUTO_TEST_CASE(generic_prefixes_have_no_script_type)
{
    for (const auto* hex : {"0488b21e", "0488ade4", "043587cf", "04358394"}) {
        BOOST_CHECK(!VersionByteTable::lookup(version(hex)).script_type);
    }
}

BOOST_AUTO_TEST_CASE(lookup_rejects_unknown_prefix)
{
    for (const auto* hex : {"00000000", "01020304", "0488b21f", "ffffffff"}) {
        BOOST_CHECK_EXCEPTION(VersionByteTable::lookup(version(hex)), ConvertError,
                              test::is_error(ErrorType::UnknownVersionByte));
    }
}

BOOST_AUTO_TEST_CASE(reverse_lookup_inverts_lookup)
{
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::reverse_lookup(
        Network::Mainnet, ScriptType::P2wpkh, KeyKind::Public)), "04b24746");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::reverse_lookup(
        Network::Testnet, ScriptType::P2shP2wpkh, KeyKind::Private)), "044a4e28");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::reverse_lookup(
        Network::Testnet, ScriptType::P2wshMultisig, KeyKind::Public)), "02575483");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::reverse_lookup(
        Network::Mainnet, ScriptType::P2shP2wshMultisig, KeyKind::Private)), "0295b005");

    for (auto network : {Network::Mainnet, Network::Testnet}) {
        for (auto kind : {KeyKind::Public, KeyKind::Private}) {
            for (auto type : {ScriptType::P2shP2wpkh, ScriptType::P2wpkh,
                              ScriptType::P2shP2wshMultisig, ScriptType::P2wshMultisig}) {
                auto entry = VersionByteTable::lookup(VersionByteTable::reverse_lookup(network, type, kind));
                BOOST_CHECK(entry.network == network);
                BOOST_CHECK(entry.script_type == type);
                BOOST_CHECK(entry.key_kind == kind);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(reverse_lookup_fails_without_slip132_prefix)
{
    for (auto type : {ScriptType::P2pkh, ScriptType::P2shMultisig}) {
        BOOST_CHECK_EXCEPTION(VersionByteTable::reverse_lookup(Network::Mainnet, type, KeyKind::Public),
                              ConvertError, test::is_error(ErrorType::NoCanonicalVersion));
    }
}

BOOST_AUTO_TEST_CASE(canonicalize_keeps_network_and_key_kind)
{
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::canonicalize(version("045f1cf6"))), "043587cf");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::canonicalize(version("02aa7a99"))), "0488ade4");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::canonicalize(version("049d7cb2"))), "0488b21e");
    BOOST_CHECK_EQUAL(HexUtils::encode(VersionByteTable::canonicalize(version("0488b21e"))), "0488b21e");
    BOOST_CHECK_EXCEPTION(VersionByteTable::canonicalize(version("01020304")), ConvertError,
                          test::is_error(ErrorType::UnknownVersionByte));
}

BOOST_AUTO_TEST_SUITE_END()
