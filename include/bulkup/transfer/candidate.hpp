#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/core/time.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace bulkup::transfer {

class ContentFingerprinter;

/**
 * @brief Immutable description of a local file eligible for upload
 */
class CandidateFile {
public:
    CandidateFile(std::filesystem::path local_path,
                  std::string name,
                  std::string directory,
                  std::uint64_t size,
                  std::string media_type,
                  std::string permissions,
                  Timestamp updated_at);

    [[nodiscard]] const std::filesystem::path& local_path() const noexcept { return local_path_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    /// POSIX-style directory relative to the transfer root ("." for top-level files)
    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::string& media_type() const noexcept { return media_type_; }
    [[nodiscard]] const std::string& permissions() const noexcept { return permissions_; }
    [[nodiscard]] Timestamp updated_at() const noexcept { return updated_at_; }

    /// directory/name, or just name at the root
    [[nodiscard]] std::string relative_path() const;

    /// Key used by the persistence log
    [[nodiscard]] std::string resolved_path() const { return local_path_.string(); }

    /**
     * @brief Computes the content fingerprint from the bytes currently on disk
     *
     * Not cached: the file may change between discovery and upload.
     */
    [[nodiscard]] Result<std::string> fingerprint(const ContentFingerprinter& fingerprinter) const;

private:
    std::filesystem::path local_path_;
    std::string name_;
    std::string directory_;
    std::uint64_t size_ = 0;
    std::string media_type_;
    std::string permissions_;
    Timestamp updated_at_{};
};

using CandidateRef = std::shared_ptr<const CandidateFile>;

/**
 * @brief Builds a candidate for a file under root
 *
 * The local path is canonicalized so it can be used as a persistence key.
 * Fails when the file cannot be stat'ed or is not below root.
 */
Result<CandidateRef> build_candidate(const std::filesystem::path& root,
                                     const std::filesystem::path& file);

/// Media type guessed from the file extension; unknown extensions map to application/octet-stream
std::string guess_media_type(const std::filesystem::path& file);

/// "rwxr-x---" style rendering of the permission bits
std::string permission_string(std::filesystem::perms perms);

} // namespace bulkup::transfer
