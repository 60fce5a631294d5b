#include "HashAlgorithm.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

#include <absl/container/flat_hash_map.h>
#include <boost/crc.hpp>
#include <openssl/evp.h>

namespace fairbloom {
namespace {
std::string to_lower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

auto get_message_digest(HashAlgorithm algorithm) -> EVP_MD const* {
    switch (algorithm) {
        case HashAlgorithm::Md5:
            return EVP_md5();
        case HashAlgorithm::Sha1:
            return EVP_sha1();
        case HashAlgorithm::Sha224:
            return EVP_sha224();
        case HashAlgorithm::Sha256:
            return EVP_sha256();
        case HashAlgorithm::Sha384:
            return EVP_sha384();
        case HashAlgorithm::Sha512:
            return EVP_sha512();
        case HashAlgorithm::Sha512_224:
            return EVP_sha512_224();
        case HashAlgorithm::Sha512_256:
            return EVP_sha512_256();
        case HashAlgorithm::Sha3_224:
            return EVP_sha3_224();
        case HashAlgorithm::Sha3_256:
            return EVP_sha3_256();
        case HashAlgorithm::Sha3_384:
            return EVP_sha3_384();
        case HashAlgorithm::Sha3_512:
            return EVP_sha3_512();
        case HashAlgorithm::Blake2b512:
            return EVP_blake2b512();
        case HashAlgorithm::Blake2s256:
            return EVP_blake2s256();
    }
    return nullptr;
}

auto get_name_map() -> absl::flat_hash_map<std::string, HashAlgorithm> const& {
    static auto const name_map = [] {
        absl::flat_hash_map<std::string, HashAlgorithm> map;
        for (auto const algorithm : cHashAlgorithms) {
            map.emplace(std::string{hash_algorithm_to_string(algorithm)}, algorithm);
        }
        return map;
    }();
    return name_map;
}
}  // namespace

auto parse_hash_algorithm(std::string_view name) -> std::optional<HashAlgorithm> {
    auto const& name_map = get_name_map();
    auto const it = name_map.find(to_lower(name));
    if (name_map.end() == it) {
        return std::nullopt;
    }
    return it->second;
}

auto hash_algorithm_to_string(HashAlgorithm algorithm) -> std::string_view {
    switch (algorithm) {
        case HashAlgorithm::Md5:
            return "md5";
        case HashAlgorithm::Sha1:
            return "sha1";
        case HashAlgorithm::Sha224:
            return "sha224";
        case HashAlgorithm::Sha256:
            return "sha256";
        case HashAlgorithm::Sha384:
            return "sha384";
        case HashAlgorithm::Sha512:
            return "sha512";
        case HashAlgorithm::Sha512_224:
            return "sha512-224";
        case HashAlgorithm::Sha512_256:
            return "sha512-256";
        case HashAlgorithm::Sha3_224:
            return "sha3-224";
        case HashAlgorithm::Sha3_256:
            return "sha3-256";
        case HashAlgorithm::Sha3_384:
            return "sha3-384";
        case HashAlgorithm::Sha3_512:
            return "sha3-512";
        case HashAlgorithm::Blake2b512:
            return "blake2b512";
        case HashAlgorithm::Blake2s256:
            return "blake2s256";
    }
    return "unknown";
}

auto is_hash_algorithm_available(HashAlgorithm algorithm) -> bool {
    auto const* message_digest = get_message_digest(algorithm);
    if (nullptr == message_digest) {
        return false;
    }
    // The loaded providers decide whether the algorithm can actually be used
    std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)> const fetched{
            EVP_MD_fetch(nullptr, EVP_MD_get0_name(message_digest), nullptr),
            &EVP_MD_free
    };
    return nullptr != fetched;
}

auto get_digest(HashAlgorithm algorithm, std::string_view input, std::vector<unsigned char>& digest)
        -> ErrorCode {
    auto const* message_digest = get_message_digest(algorithm);
    if (nullptr == message_digest) {
        return ErrorCodeUnsupported;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context{
            EVP_MD_CTX_new(),
            &EVP_MD_CTX_free
    };
    if (nullptr == context) {
        return ErrorCodeFailure;
    }
    if (1 != EVP_DigestInit_ex(context.get(), message_digest, nullptr)) {
        return ErrorCodeFailure;
    }
    if (1 != EVP_DigestUpdate(context.get(), input.data(), input.size())) {
        return ErrorCodeFailure;
    }

    digest.resize(EVP_MAX_MD_SIZE);
    unsigned int digest_length{0};
    if (1 != EVP_DigestFinal_ex(context.get(), digest.data(), &digest_length)) {
        return ErrorCodeFailure;
    }
    digest.resize(digest_length);
    return ErrorCodeSuccess;
}

auto fold_digest(std::span<unsigned char const> digest) -> uint32_t {
    boost::crc_32_type crc;
    crc.process_bytes(digest.data(), digest.size());
    return static_cast<uint32_t>(crc.checksum());
}
}  // namespace fairbloom
