#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "../src/fairbloom/ErrorCode.hpp"
#include "../src/fairbloom/filter/Aggregate.hpp"
#include "../src/fairbloom/filter/Filter.hpp"
#include "../src/fairbloom/filter/FilterComponent.hpp"
#include "../src/fairbloom/filter/FilterFile.hpp"
#include "../src/fairbloom/filter/HashAlgorithm.hpp"
#include "../src/fairbloom/TraceableException.hpp"

using fairbloom::Aggregate;
using fairbloom::ErrorCode;
using fairbloom::ErrorCodeCorrupt;
using fairbloom::ErrorCodeFileNotFound;
using fairbloom::ErrorCodeIncompatible;
using fairbloom::Filter;
using fairbloom::FilterComponent;
using fairbloom::HashAlgorithm;
using fairbloom::TraceableException;
using fairbloom::filter::read_filter_file;
using fairbloom::filter::write_filter_file;

namespace {
template <typename Callable>
auto get_error_code(Callable&& callable) -> std::optional<ErrorCode> {
    try {
        callable();
    } catch (TraceableException const& e) {
        return e.get_error_code();
    }
    return std::nullopt;
}

class FilterFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto const* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = std::filesystem::temp_directory_path()
                / (std::string{"fairbloom-"} + test_info->name());
        std::filesystem::remove_all(m_dir);
    }

    void TearDown() override { std::filesystem::remove_all(m_dir); }

    [[nodiscard]] auto get_path(std::string const& name) const -> std::string {
        return (m_dir / name).string();
    }

    void write_raw(std::string const& name, std::string const& content) const {
        std::filesystem::create_directories(m_dir);
        std::ofstream out(get_path(name), std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::filesystem::path m_dir;
};

auto make_serialized_filter(size_t size, std::string const& bits) -> nlohmann::json {
    return {{"type", "filter"},
            {"size", size},
            {"hash_algorithms", nlohmann::json::array({"sha1", "md5"})},
            {"count", 0},
            {"int_size", Filter::cNativeWordBits},
            {"bits", bits}};
}
}  // namespace

TEST_F(FilterFileTest, FilterRoundTrip) {
    Filter filter{300, std::vector<HashAlgorithm>{HashAlgorithm::Sha512_256, HashAlgorithm::Md5}};
    for (int i = 0; i < 20; ++i) {
        filter.add("item-" + std::to_string(i));
    }

    auto const path = get_path("filter.json");
    write_filter_file(path, filter);
    auto const loaded = read_filter_file(path);

    auto const* loaded_filter = loaded.get_if_filter();
    ASSERT_NE(nullptr, loaded_filter);
    EXPECT_EQ(filter, *loaded_filter);
    EXPECT_EQ(
            (std::vector<HashAlgorithm>{HashAlgorithm::Sha512_256, HashAlgorithm::Md5}),
            loaded_filter->get_hashes()
    );
    EXPECT_EQ(20U, loaded_filter->count());
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(loaded_filter->has("item-" + std::to_string(i)));
    }
}

TEST_F(FilterFileTest, AggregateRoundTrip) {
    Aggregate aggregate;
    aggregate.attach(Filter{512, std::vector<HashAlgorithm>{HashAlgorithm::Sha1}})
            .attach(Filter{1024, std::vector<HashAlgorithm>{HashAlgorithm::Sha256}});
    for (int i = 0; i < 9; ++i) {
        aggregate.add("item-" + std::to_string(i));
    }

    auto const path = get_path("aggregate.json");
    write_filter_file(path, aggregate);
    auto const loaded = read_filter_file(path);

    auto const* loaded_aggregate = loaded.get_if_aggregate();
    ASSERT_NE(nullptr, loaded_aggregate);
    EXPECT_EQ(aggregate.get_scheduler(), loaded_aggregate->get_scheduler());
    EXPECT_EQ(aggregate.to_json(), loaded.to_json());
}

TEST_F(FilterFileTest, SerializedLayout) {
    Filter filter{16, std::vector<HashAlgorithm>{HashAlgorithm::Sha1}};
    auto const serialized = filter.to_json();
    EXPECT_EQ("filter", serialized.at("type").get<std::string>());
    EXPECT_EQ(16U, serialized.at("size").get<size_t>());
    EXPECT_EQ(
            std::vector<std::string>{"sha1"},
            serialized.at("hash_algorithms").get<std::vector<std::string>>()
    );
    EXPECT_EQ(0U, serialized.at("count").get<size_t>());
    EXPECT_EQ(Filter::cNativeWordBits, serialized.at("int_size").get<uint32_t>());
    EXPECT_EQ("0000", serialized.at("bits").get<std::string>());
}

TEST_F(FilterFileTest, BitsAreLeastSignificantFirst) {
    auto const low = Filter::from_json(make_serialized_filter(16, "0100"));
    EXPECT_TRUE(low.test_bit(0));
    for (size_t bit = 1; bit < 16; ++bit) {
        EXPECT_FALSE(low.test_bit(bit));
    }

    auto const high = Filter::from_json(make_serialized_filter(16, "0080"));
    EXPECT_TRUE(high.test_bit(15));
    EXPECT_FALSE(high.test_bit(7));
    EXPECT_EQ("0080", high.to_hex_string());
}

TEST_F(FilterFileTest, RejectsForeignWordSize) {
    auto serialized = make_serialized_filter(16, "0000");
    serialized["int_size"] = Filter::cNativeWordBits / 2;
    write_raw("foreign.json", serialized.dump());
    EXPECT_EQ(ErrorCodeIncompatible, get_error_code([&] {
                  static_cast<void>(read_filter_file(get_path("foreign.json")));
              }));
}

TEST_F(FilterFileTest, RejectsCorruptBits) {
    EXPECT_EQ(ErrorCodeCorrupt, get_error_code([] {
                  static_cast<void>(Filter::from_json(make_serialized_filter(16, "00zz")));
              }));
    EXPECT_EQ(ErrorCodeCorrupt, get_error_code([] {
                  static_cast<void>(Filter::from_json(make_serialized_filter(16, "00")));
              }));
    // Bit 4 is beyond a 4-bit filter
    EXPECT_EQ(ErrorCodeCorrupt, get_error_code([] {
                  static_cast<void>(Filter::from_json(make_serialized_filter(4, "10")));
              }));
    EXPECT_EQ(ErrorCodeCorrupt, get_error_code([] {
                  auto serialized = make_serialized_filter(16, "0000");
                  serialized.erase("size");
                  static_cast<void>(Filter::from_json(serialized));
              }));
}

TEST_F(FilterFileTest, MissingFile) {
    EXPECT_EQ(ErrorCodeFileNotFound, get_error_code([&] {
                  static_cast<void>(read_filter_file(get_path("missing.json")));
              }));
}

TEST_F(FilterFileTest, NotJson) {
    write_raw("garbage.json", "not a filter");
    EXPECT_EQ(ErrorCodeCorrupt, get_error_code([&] {
                  static_cast<void>(read_filter_file(get_path("garbage.json")));
              }));
}

TEST_F(FilterFileTest, CreatesParentDirectories) {
    auto const path = get_path("nested/dir/filter.json");
    write_filter_file(path, Filter{64, std::vector<HashAlgorithm>{HashAlgorithm::Md5}});
    EXPECT_TRUE(std::filesystem::is_regular_file(path));
    EXPECT_EQ(64U, read_filter_file(path).get_if_filter()->get_size());
}
