#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/fingerprint.hpp"
#include "bulkup/transfer/transport.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace bulkup::transport {

/**
 * @brief One slice of a file on its way to the staging area
 */
struct FileChunk {
    std::uint32_t index = 0;
    std::uint32_t total_chunks = 0;
    std::uint64_t offset = 0;
    std::vector<char> data;
    std::string checksum;  ///< Fingerprint of data
};

/**
 * @brief Transport that "uploads" into a local destination directory
 *
 * Files are copied chunk by chunk into
 * staging_root/<upload id>/<relative path>, checked against the source
 * fingerprint, then renamed to destination_root/<relative dir>/<name>.
 * Nothing becomes visible at the destination until the whole file has been
 * verified. Useful for mirroring to mounted storage and for exercising the
 * engine without a network.
 *
 * Safe to call concurrently: every upload stages under its own id.
 */
class DirectoryTransport : public transfer::Transport {
public:
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    DirectoryTransport(std::filesystem::path destination_root,
                       std::filesystem::path staging_root,
                       std::size_t chunk_size = kDefaultChunkSize,
                       std::string digest = transfer::ContentFingerprinter::kDefaultAlgorithm);

    Outcome<transfer::TransferReceipt> upload(const transfer::CandidateFile& candidate) override;

    [[nodiscard]] const std::filesystem::path& destination_root() const noexcept { return destination_root_; }
    [[nodiscard]] const std::filesystem::path& staging_root() const noexcept { return staging_root_; }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

    /// Where a candidate ends up once published
    [[nodiscard]] std::filesystem::path destination_for(const transfer::CandidateFile& candidate) const;

private:
    using ChunkSink = std::function<Result<void>(FileChunk&&)>;

    Result<void> read_chunks(const std::filesystem::path& source, const ChunkSink& sink) const;
    Result<void> apply_chunk(const FileChunk& chunk, std::ofstream& staging_file,
                             const std::filesystem::path& staging_path) const;
    Result<void> publish(const std::filesystem::path& staging_path,
                         const std::filesystem::path& destination_path,
                         const std::string& expected_fingerprint) const;

    static Result<void> ensure_parent_exists(const std::filesystem::path& path);

    std::filesystem::path destination_root_;
    std::filesystem::path staging_root_;
    std::size_t chunk_size_;
    transfer::ContentFingerprinter fingerprinter_;
    std::atomic<std::uint64_t> upload_counter_{0};
};

} // namespace bulkup::transport
