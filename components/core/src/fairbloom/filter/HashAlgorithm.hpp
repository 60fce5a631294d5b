#ifndef FAIRBLOOM_HASHALGORITHM_HPP
#define FAIRBLOOM_HASHALGORITHM_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "../ErrorCode.hpp"

namespace fairbloom {
/**
 * Digest algorithms a filter can derive bit positions from
 */
enum class HashAlgorithm : uint8_t {
    Md5 = 0,
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512,
    Sha512_224,
    Sha512_256,
    Sha3_224,
    Sha3_256,
    Sha3_384,
    Sha3_512,
    Blake2b512,
    Blake2s256,
};

constexpr std::array<HashAlgorithm, 14> cHashAlgorithms{
        HashAlgorithm::Md5,
        HashAlgorithm::Sha1,
        HashAlgorithm::Sha224,
        HashAlgorithm::Sha256,
        HashAlgorithm::Sha384,
        HashAlgorithm::Sha512,
        HashAlgorithm::Sha512_224,
        HashAlgorithm::Sha512_256,
        HashAlgorithm::Sha3_224,
        HashAlgorithm::Sha3_256,
        HashAlgorithm::Sha3_384,
        HashAlgorithm::Sha3_512,
        HashAlgorithm::Blake2b512,
        HashAlgorithm::Blake2s256
};

/**
 * @param name Case-insensitive algorithm name (e.g. "sha256", "sha3-512")
 * @return The matching algorithm, or std::nullopt if the name isn't in the registry
 */
[[nodiscard]] auto parse_hash_algorithm(std::string_view name) -> std::optional<HashAlgorithm>;

[[nodiscard]] auto hash_algorithm_to_string(HashAlgorithm algorithm) -> std::string_view;

/**
 * @param algorithm
 * @return Whether the linked crypto library provides the algorithm
 */
[[nodiscard]] auto is_hash_algorithm_available(HashAlgorithm algorithm) -> bool;

/**
 * Computes the digest of the given input
 * @param algorithm
 * @param input
 * @param digest Returns the digest bytes
 * @return ErrorCodeSuccess on success
 * @return ErrorCodeUnsupported if the algorithm isn't available
 * @return ErrorCodeFailure if the digest couldn't be computed
 */
auto get_digest(HashAlgorithm algorithm, std::string_view input, std::vector<unsigned char>& digest)
        -> ErrorCode;

/**
 * Folds a digest into its CRC-32 checksum
 * @param digest
 * @return The checksum as an unsigned 32-bit value, independent of the native word width
 */
[[nodiscard]] auto fold_digest(std::span<unsigned char const> digest) -> uint32_t;
}  // namespace fairbloom

#endif  // FAIRBLOOM_HASHALGORITHM_HPP
