#pragma once

#include "bulkup/core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace bulkup::transfer {

/**
 * @brief Cryptographic content digests backed by OpenSSL EVP
 *
 * The algorithm is any name EVP_get_digestbyname() understands
 * ("sha256", "sha512", "blake2b512", ...). Output is lowercase hex.
 */
class ContentFingerprinter {
public:
    static constexpr const char* kDefaultAlgorithm = "sha256";
    static constexpr std::size_t kReadBufferSize = 64 * 1024;

    explicit ContentFingerprinter(std::string algorithm = kDefaultAlgorithm);

    [[nodiscard]] const std::string& algorithm() const noexcept { return algorithm_; }

    /// True when OpenSSL knows the configured algorithm
    [[nodiscard]] bool available() const;

    Result<std::string> fingerprint_file(const std::filesystem::path& path) const;
    Result<std::string> fingerprint_bytes(std::string_view data) const;

private:
    std::string algorithm_;
};

} // namespace bulkup::transfer
