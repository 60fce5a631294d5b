#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "../src/fairbloom/ErrorCode.hpp"
#include "../src/fairbloom/filter/HashAlgorithm.hpp"

using fairbloom::cHashAlgorithms;
using fairbloom::ErrorCodeSuccess;
using fairbloom::fold_digest;
using fairbloom::get_digest;
using fairbloom::hash_algorithm_to_string;
using fairbloom::HashAlgorithm;
using fairbloom::is_hash_algorithm_available;
using fairbloom::parse_hash_algorithm;

namespace {
auto to_hex(std::vector<unsigned char> const& bytes) -> std::string {
    constexpr std::string_view cHexDigits{"0123456789abcdef"};
    std::string hex;
    for (auto const byte : bytes) {
        hex.push_back(cHexDigits[byte >> 4]);
        hex.push_back(cHexDigits[byte & 0x0F]);
    }
    return hex;
}
}  // namespace

TEST(HashAlgorithmTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(HashAlgorithm::Sha256, parse_hash_algorithm("sha256"));
    EXPECT_EQ(HashAlgorithm::Sha256, parse_hash_algorithm("SHA256"));
    EXPECT_EQ(HashAlgorithm::Sha3_512, parse_hash_algorithm("Sha3-512"));
    EXPECT_EQ(HashAlgorithm::Sha512_224, parse_hash_algorithm("sha512-224"));
    EXPECT_EQ(HashAlgorithm::Blake2s256, parse_hash_algorithm("blake2s256"));
}

TEST(HashAlgorithmTest, RejectsUnknownNames) {
    EXPECT_FALSE(parse_hash_algorithm("crc32").has_value());
    EXPECT_FALSE(parse_hash_algorithm("").has_value());
    EXPECT_FALSE(parse_hash_algorithm("sha256 ").has_value());
}

TEST(HashAlgorithmTest, NamesRoundTrip) {
    for (auto const algorithm : cHashAlgorithms) {
        EXPECT_EQ(algorithm, parse_hash_algorithm(hash_algorithm_to_string(algorithm)));
    }
}

TEST(HashAlgorithmTest, DigestsMatchReferenceValues) {
    ASSERT_TRUE(is_hash_algorithm_available(HashAlgorithm::Md5));
    ASSERT_TRUE(is_hash_algorithm_available(HashAlgorithm::Sha256));

    std::vector<unsigned char> digest;
    ASSERT_EQ(ErrorCodeSuccess, get_digest(HashAlgorithm::Md5, "", digest));
    EXPECT_EQ("d41d8cd98f00b204e9800998ecf8427e", to_hex(digest));

    ASSERT_EQ(ErrorCodeSuccess, get_digest(HashAlgorithm::Sha256, "abc", digest));
    EXPECT_EQ(
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
            to_hex(digest)
    );
}

TEST(HashAlgorithmTest, DigestLengths) {
    std::vector<unsigned char> digest;
    ASSERT_EQ(ErrorCodeSuccess, get_digest(HashAlgorithm::Sha1, "item", digest));
    EXPECT_EQ(20U, digest.size());
    ASSERT_EQ(ErrorCodeSuccess, get_digest(HashAlgorithm::Sha3_224, "item", digest));
    EXPECT_EQ(28U, digest.size());
    ASSERT_EQ(ErrorCodeSuccess, get_digest(HashAlgorithm::Blake2b512, "item", digest));
    EXPECT_EQ(64U, digest.size());
}

TEST(HashAlgorithmTest, FoldsWithCrc32) {
    std::string_view const check_input{"123456789"};
    std::vector<unsigned char> const bytes(check_input.begin(), check_input.end());
    EXPECT_EQ(0xCBF43926U, fold_digest(bytes));
    EXPECT_EQ(0U, fold_digest({}));
}

TEST(HashAlgorithmTest, AvailableAlgorithmsProduceDigests) {
    std::vector<unsigned char> digest;
    for (auto const algorithm : cHashAlgorithms) {
        if (false == is_hash_algorithm_available(algorithm)) {
            continue;
        }
        EXPECT_EQ(ErrorCodeSuccess, get_digest(algorithm, "item", digest))
                << hash_algorithm_to_string(algorithm);
        EXPECT_FALSE(digest.empty()) << hash_algorithm_to_string(algorithm);
    }
    EXPECT_TRUE(is_hash_algorithm_available(HashAlgorithm::Sha256));
}
