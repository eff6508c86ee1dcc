// Copyright (c) 2026 The scverify developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/hmac_sha256.h>
#include <crypto/sha256.h>
#include <test/test_scverify.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(crypto_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(sha256_testvectors)
{
    BOOST_CHECK_EQUAL(SHA256Hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(SHA256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    // incremental writes
    CSHA256 hasher;
    unsigned char hash[CSHA256::OUTPUT_SIZE];
    hasher.Write((const unsigned char*)"a", 1).Write((const unsigned char*)"bc", 2).Finalize(hash);
    BOOST_CHECK_EQUAL(HexStr(hash, hash + sizeof(hash)), SHA256Hex("abc"));
}

BOOST_AUTO_TEST_CASE(hmac_sha256_testvectors)
{
    // RFC 4231 test case 2
    std::string mac = HMACSHA256("Jefe", "what do ya want for nothing?");
    BOOST_CHECK_EQUAL(HexStr(mac.begin(), mac.end()), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    // key longer than the block size
    std::string key(131, '\xaa');
    mac = HMACSHA256(key, "Test Using Larger Than Block-Size Key - Hash Key First");
    BOOST_CHECK_EQUAL(HexStr(mac.begin(), mac.end()), "60e431591ee0b67f0d8a26aacbf5b77f8e0bc6213728c5140546040f0ee37f54");
}

BOOST_AUTO_TEST_SUITE_END()
