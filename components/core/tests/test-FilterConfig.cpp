#include <optional>
#include <vector>

#include <gtest/gtest.h>

#include "../src/fairbloom/ErrorCode.hpp"
#include "../src/fairbloom/filter/HashAlgorithm.hpp"
#include "../src/fairbloom/FilterConfig.hpp"

using fairbloom::ErrorCodeBadParam;
using fairbloom::FilterConfig;
using fairbloom::FilterConfigValidationFailed;
using fairbloom::hash_algorithm_list_to_string;
using fairbloom::HashAlgorithm;
using fairbloom::parse_hash_algorithm_list;
using fairbloom::validate_filter_config;

namespace {
auto is_rejected(FilterConfig const& config) -> bool {
    try {
        validate_filter_config(config);
    } catch (FilterConfigValidationFailed const& e) {
        return ErrorCodeBadParam == e.get_error_code();
    }
    return false;
}
}  // namespace

TEST(FilterConfigTest, DefaultsAreValid) {
    FilterConfig const config;
    EXPECT_DOUBLE_EQ(0.01, config.false_positive_rate);
    EXPECT_EQ(1000, config.capacity);
    EXPECT_DOUBLE_EQ(1.0, config.false_probability_threshold);
    EXPECT_TRUE(config.hash_algorithms.empty());
    EXPECT_NO_THROW(validate_filter_config(config));
}

TEST(FilterConfigTest, RejectsOutOfRangeValues) {
    FilterConfig config;
    config.false_positive_rate = 0.0;
    EXPECT_TRUE(is_rejected(config));
    config.false_positive_rate = 1.0;
    EXPECT_TRUE(is_rejected(config));

    config = FilterConfig{};
    config.capacity = 0;
    EXPECT_TRUE(is_rejected(config));

    config = FilterConfig{};
    config.false_probability_threshold = 1.5;
    EXPECT_TRUE(is_rejected(config));
    config.false_probability_threshold = 0.0;
    EXPECT_FALSE(is_rejected(config));
}

TEST(FilterConfigTest, RejectsDuplicateHashAlgorithms) {
    FilterConfig config;
    config.hash_algorithms = {HashAlgorithm::Md5, HashAlgorithm::Sha1, HashAlgorithm::Md5};
    EXPECT_TRUE(is_rejected(config));
}

TEST(FilterConfigTest, ParsesHashAlgorithmLists) {
    EXPECT_EQ(
            (std::vector<HashAlgorithm>{HashAlgorithm::Sha256, HashAlgorithm::Md5}),
            parse_hash_algorithm_list(" sha256, MD5 ")
    );
    EXPECT_EQ(
            (std::vector<HashAlgorithm>{HashAlgorithm::Sha3_256}),
            parse_hash_algorithm_list("sha3-256,")
    );
    EXPECT_FALSE(parse_hash_algorithm_list("sha256,nope").has_value());
    EXPECT_FALSE(parse_hash_algorithm_list("").has_value());
    EXPECT_FALSE(parse_hash_algorithm_list(" , ").has_value());
}

TEST(FilterConfigTest, FormatsHashAlgorithmLists) {
    EXPECT_EQ(
            "sha256,md5,blake2b512",
            hash_algorithm_list_to_string(
                    {HashAlgorithm::Sha256, HashAlgorithm::Md5, HashAlgorithm::Blake2b512}
            )
    );
    EXPECT_EQ("", hash_algorithm_list_to_string({}));
}
