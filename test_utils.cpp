#define BOOST_TEST_MODULE utils
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include "hash_utils.hpp"
#include "utils.hpp"

using namespace shaforge;

BOOST_AUTO_TEST_CASE(hex_round_trip) {
    std::vector<uint8_t> bytes = hexToBytes("00ff10Ab");
    std::vector<uint8_t> expected = {0x00, 0xff, 0x10, 0xab};
    BOOST_CHECK(bytes == expected);
    BOOST_CHECK_EQUAL(bytesToHex(bytes), "00ff10ab");
    BOOST_CHECK(hexToBytes("").empty());
}

BOOST_AUTO_TEST_CASE(hex_rejects_malformed_input) {
    BOOST_CHECK_THROW(hexToBytes("abc"), std::invalid_argument);
    BOOST_CHECK_THROW(hexToBytes("zz"), std::invalid_argument);
    BOOST_CHECK_THROW(hexToBytes("0x12"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(digest_hex_keeps_leading_zeros) {
    Digest d{};
    d[1] = 0x0f;
    d[31] = 0xff;
    std::string hex = digestToHex(d);
    BOOST_CHECK_EQUAL(hex.size(), 64u);
    BOOST_CHECK_EQUAL(hex.substr(0, 4), "000f");
    BOOST_CHECK_EQUAL(hex.substr(62), "ff");
    BOOST_CHECK_EQUAL(hex, bytesToHex(std::vector<uint8_t>(d.begin(), d.end())));
}

BOOST_AUTO_TEST_CASE(word_to_hex) {
    BOOST_CHECK_EQUAL(toHex(0xdeadbeefu), "deadbeef");
    BOOST_CHECK_EQUAL(toHex(1u), "00000001");
}

BOOST_AUTO_TEST_CASE(read_file_bytes) {
    const std::string path = "shaforge_utils_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "abc";
    }
    std::vector<uint8_t> data = readFileBytes(path);
    std::remove(path.c_str());

    BOOST_CHECK_EQUAL(data.size(), 3u);
    BOOST_CHECK(hash(data) == hash(std::string("abc")));
    BOOST_CHECK_THROW(readFileBytes("does/not/exist.bin"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(digest_conversion_and_comparison) {
    Digest abc = toDigest(hexToBytes("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
    BOOST_CHECK(abc == hash(std::string("abc")));
    BOOST_CHECK_THROW(toDigest(std::vector<uint8_t>(31)), std::invalid_argument);

    Digest low{};
    Digest high{};
    high[0] = 1;
    BOOST_CHECK_EQUAL(digestCompare(low, high), -1);
    BOOST_CHECK_EQUAL(digestCompare(high, low), 1);
    BOOST_CHECK_EQUAL(digestCompare(abc, abc), 0);

    BOOST_CHECK(digestsEqual(abc, abc));
    BOOST_CHECK(!digestsEqual(low, high));
}

BOOST_AUTO_TEST_CASE(candidate_matches_target) {
    Digest target = hash(std::string("hunter2"));
    BOOST_CHECK(matchesTarget({'h', 'u', 'n', 't', 'e', 'r', '2'}, target));
    BOOST_CHECK(!matchesTarget({'h', 'u', 'n', 't', 'e', 'r', '3'}, target));
}
