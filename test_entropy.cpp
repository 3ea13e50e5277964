#define BOOST_TEST_MODULE entropy_metrics
#include <boost/test/unit_test.hpp>
#include <string>
#include <vector>
#include "entropy_metrics.hpp"

using namespace shaforge;

BOOST_AUTO_TEST_CASE(bits_are_msb_first) {
    auto bits = entropy::bytes_to_bits({0x80, 0x01});
    BOOST_REQUIRE_EQUAL(bits.size(), 16u);
    BOOST_CHECK(bits[0]);
    for (int i = 1; i < 15; ++i) BOOST_CHECK(!bits[i]);
    BOOST_CHECK(bits[15]);
}

BOOST_AUTO_TEST_CASE(hamming_distance_of_digests) {
    Digest zeros{};
    Digest ones;
    ones.fill(0xff);
    BOOST_CHECK_EQUAL(entropy::hamming_distance(zeros, zeros), 0);
    BOOST_CHECK_EQUAL(entropy::hamming_distance(zeros, ones), 256);

    Digest one = zeros;
    one[31] = 0x03;
    BOOST_CHECK_EQUAL(entropy::hamming_distance(zeros, one), 2);
}

BOOST_AUTO_TEST_CASE(shannon_entropy_bounds) {
    BOOST_CHECK_CLOSE(entropy::shannon_entropy({true, false}), 1.0, 1e-9);
    BOOST_CHECK_EQUAL(entropy::shannon_entropy({false, false, false}), 0.0);
    BOOST_CHECK_EQUAL(entropy::shannon_entropy({}), 0.0);
}

BOOST_AUTO_TEST_CASE(single_bit_flips_change_about_half_the_output) {
    std::string text = "abc";
    std::vector<uint8_t> msg(text.begin(), text.end());
    auto report = entropy::avalanche_profile(msg, 1000);

    BOOST_CHECK_EQUAL(report.trials, 24u);
    BOOST_CHECK_GT(report.meanFlippedBits, 96.0);
    BOOST_CHECK_LT(report.meanFlippedBits, 160.0);
    BOOST_CHECK_GT(report.minFlippedBits, 64);
    BOOST_CHECK_LT(report.maxFlippedBits, 192);
    BOOST_CHECK_CLOSE(report.meanRatio, report.meanFlippedBits / 256.0, 1e-9);
}

BOOST_AUTO_TEST_CASE(avalanche_limits) {
    auto empty = entropy::avalanche_profile({}, 10);
    BOOST_CHECK_EQUAL(empty.trials, 0u);

    auto capped = entropy::avalanche_profile(std::vector<uint8_t>(16, 0), 5);
    BOOST_CHECK_EQUAL(capped.trials, 5u);
}
