#define BOOST_TEST_MODULE digest
#include <boost/test/unit_test.hpp>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include "batch_hasher.hpp"
#include "digest.hpp"
#include "sha256_wrapper.hpp"

using namespace shaforge;

BOOST_AUTO_TEST_CASE(nist_vectors) {
    BOOST_CHECK_EQUAL(hashHex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    BOOST_CHECK_EQUAL(hashHex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_CHECK_EQUAL(hashHex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
                      "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

BOOST_AUTO_TEST_CASE(one_million_a) {
    std::vector<uint8_t> msg(1000000, 'a');
    BOOST_CHECK_EQUAL(digestToHex(hash(msg)),
                      "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

BOOST_AUTO_TEST_CASE(padding_boundaries) {
    BOOST_CHECK_EQUAL(hashHex(std::string(55, 'a')),
                      "9f4390f8d30c2dd92ec9f095b65e2b9ae9b0a925a5258e241c9f1e910f734318");
    BOOST_CHECK_EQUAL(hashHex(std::string(56, 'a')),
                      "b35439a4ac6f0948b6d6f9e3c6af0f5f590ce20f1bde7090ef7970686ec6738a");
    BOOST_CHECK_EQUAL(hashHex(std::string(64, 'a')),
                      "ffe054fe7ae0cb6dc65c3af9b61d5209f439851db43d0ba5997337df154668eb");
    for (std::size_t len : {55u, 56u, 63u, 64u, 65u, 119u, 120u, 128u})
        BOOST_CHECK_MESSAGE(matchesReference(std::vector<uint8_t>(len, 0x5a)), "length " << len);
}

BOOST_AUTO_TEST_CASE(overloads_agree) {
    std::string text = "The quick brown fox jumps over the lazy dog";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    BOOST_CHECK(hash(text) == hash(bytes));
    BOOST_CHECK(hash(bytes.data(), bytes.size()) == hash(bytes));
    BOOST_CHECK_EQUAL(digestToHex(hash(text)),
                      "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

BOOST_AUTO_TEST_CASE(double_hash) {
    std::vector<uint8_t> abc = {'a', 'b', 'c'};
    BOOST_CHECK_EQUAL(digestToHex(hashDouble(abc)),
                      "4f8b42c22dd3729b519ba6f68d2da7cc5b2d606d05daed5ad5128cc03e6c6358");
}

BOOST_AUTO_TEST_CASE(differential_against_openssl) {
    std::mt19937 rng(20261018);
    std::uniform_int_distribution<std::size_t> lenDist(0, 1024);
    std::uniform_int_distribution<int> byteDist(0, 255);

    int mismatches = 0;
    for (int t = 0; t < 10000; ++t) {
        std::vector<uint8_t> msg(lenDist(rng));
        for (auto& b : msg) b = static_cast<uint8_t>(byteDist(rng));
        if (hash(msg) != referenceSha256(msg)) ++mismatches;
    }
    BOOST_CHECK_EQUAL(mismatches, 0);
}

BOOST_AUTO_TEST_CASE(concurrent_callers_get_same_digest) {
    std::vector<uint8_t> msg(4096, 0x11);
    const Digest expected = referenceSha256(msg);

    std::vector<Digest> results(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < results.size(); ++i)
        threads.emplace_back([&, i]() { results[i] = hash(msg); });
    for (auto& t : threads) t.join();

    for (const auto& d : results)
        BOOST_CHECK(d == expected);
}

BOOST_AUTO_TEST_CASE(batch_matches_sequential) {
    std::vector<std::vector<uint8_t>> messages;
    for (std::size_t len = 0; len < 150; ++len)
        messages.push_back(std::vector<uint8_t>(len, static_cast<uint8_t>(len)));

    auto digests = hashBatch(messages, 4);
    BOOST_REQUIRE_EQUAL(digests.size(), messages.size());
    for (std::size_t i = 0; i < messages.size(); ++i)
        BOOST_CHECK(digests[i] == hash(messages[i]));

    BOOST_CHECK(hashBatch({}, 4).empty());
    BOOST_CHECK_EQUAL(hashBatch(messages, 0).size(), messages.size());
}
