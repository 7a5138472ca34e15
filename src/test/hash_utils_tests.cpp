#include <boost/test/unit_test.hpp>

#include "hash_utils.hpp"
#include "hex_utils.hpp"

#include <string>
#include <vector>

using namespace slipconv;

namespace {

std::vector<uint8_t> bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

BOOST_AUTO_TEST_SUITE(hash_utils_tests)

BOOST_AUTO_TEST_CASE(sha256_known_digests)
{
    BOOST_CHECK_EQUAL(HexUtils::encode(HashUtils::sha256(bytes("abc"))),
                      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(HexUtils::encode(HashUtils::double_sha256(bytes(""))),
                      "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

BOOST_AUTO_TEST_CASE(checksum_is_double_sha256_prefix)
{
    BOOST_CHECK_EQUAL(HexUtils::encode(HashUtils::checksum(bytes("hello"))), "9595c9df");
}

BOOST_AUTO_TEST_SUITE_END()
