#include "bulkup/transport/directory_transport.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <string_view>

namespace bulkup::transport {
namespace fs = std::filesystem;

using transfer::CandidateFile;
using transfer::TransferReceipt;

DirectoryTransport::DirectoryTransport(fs::path destination_root,
                                       fs::path staging_root,
                                       std::size_t chunk_size,
                                       std::string digest)
    : destination_root_(std::move(destination_root)),
      staging_root_(std::move(staging_root)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size),
      fingerprinter_(std::move(digest)) {}

fs::path DirectoryTransport::destination_for(const CandidateFile& candidate) const {
    return destination_root_ / fs::path(candidate.relative_path()).relative_path();
}

Outcome<TransferReceipt> DirectoryTransport::upload(const CandidateFile& candidate) {
    auto expected = candidate.fingerprint(fingerprinter_);
    if (expected.is_error()) {
        return Err<TransferReceipt>(expected.error());
    }

    const std::string upload_id = "upload-" + std::to_string(++upload_counter_);
    const fs::path staging_path = staging_root_ / upload_id / fs::path(candidate.relative_path()).relative_path();
    if (auto res = ensure_parent_exists(staging_path); res.is_error()) {
        return Err<TransferReceipt>(res.error());
    }

    auto discard_staging = [this, &upload_id]() {
        std::error_code ec;
        fs::remove_all(staging_root_ / upload_id, ec);
        if (ec) {
            spdlog::warn("Could not clean staging directory {}: {}", (staging_root_ / upload_id).string(), ec.message());
        }
    };

    std::uint64_t bytes_staged = 0;
    {
        std::ofstream staging_file(staging_path, std::ios::binary | std::ios::trunc);
        if (!staging_file) {
            discard_staging();
            return Err<TransferReceipt>(ErrorCode::RemoteService,
                                        "Failed to create staging file: " + staging_path.string());
        }

        auto streamed = read_chunks(candidate.local_path(), [&](FileChunk&& chunk) {
            bytes_staged += chunk.data.size();
            return apply_chunk(chunk, staging_file, staging_path);
        });
        if (streamed.is_error()) {
            staging_file.close();
            discard_staging();
            return Err<TransferReceipt>(streamed.error());
        }
    }

    const fs::path destination_path = destination_for(candidate);
    if (auto res = publish(staging_path, destination_path, expected.value()); res.is_error()) {
        discard_staging();
        return Err<TransferReceipt>(res.error());
    }
    discard_staging();

    spdlog::debug("Published {} ({} bytes) to {}", candidate.resolved_path(), bytes_staged, destination_path.string());

    TransferReceipt receipt;
    receipt.remote_id = candidate.relative_path();
    receipt.remote_path = destination_path.string();
    receipt.bytes_transferred = bytes_staged;
    receipt.fingerprint = expected.value();
    return Ok(std::move(receipt));
}

Result<void> DirectoryTransport::read_chunks(const fs::path& source, const ChunkSink& sink) const {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::File, "Failed to open source file: " + source.string());
    }

    std::error_code ec;
    const auto file_size = fs::file_size(source, ec);
    if (ec) {
        return Err<void>(ErrorCode::File, "Failed to stat source file: " + source.string());
    }
    const auto total_chunks = static_cast<std::uint32_t>((file_size + chunk_size_ - 1) / chunk_size_);

    std::uint32_t chunk_index = 0;
    std::uint64_t offset = 0;
    while (input) {
        FileChunk chunk;
        chunk.data.resize(chunk_size_);
        input.read(chunk.data.data(), static_cast<std::streamsize>(chunk_size_));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }
        chunk.data.resize(bytes_read);
        chunk.index = chunk_index;
        chunk.total_chunks = total_chunks;
        chunk.offset = offset;

        auto checksum = fingerprinter_.fingerprint_bytes(std::string_view(chunk.data.data(), chunk.data.size()));
        if (checksum.is_error()) {
            return Err<void>(checksum.error());
        }
        chunk.checksum = checksum.value();

        if (auto res = sink(std::move(chunk)); res.is_error()) {
            return res;
        }
        offset += bytes_read;
        ++chunk_index;
    }

    if (input.bad()) {
        return Err<void>(ErrorCode::File, "Read error on source file: " + source.string());
    }
    return Ok();
}

Result<void> DirectoryTransport::apply_chunk(const FileChunk& chunk,
                                             std::ofstream& staging_file,
                                             const fs::path& staging_path) const {
    auto checksum = fingerprinter_.fingerprint_bytes(std::string_view(chunk.data.data(), chunk.data.size()));
    if (checksum.is_error()) {
        return Err<void>(checksum.error());
    }
    if (checksum.value() != chunk.checksum) {
        return Err<void>(ErrorCode::RemoteService,
                         "Chunk " + std::to_string(chunk.index) + " checksum mismatch for " + staging_path.string());
    }

    staging_file.seekp(static_cast<std::streamoff>(chunk.offset));
    staging_file.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
    if (!staging_file) {
        return Err<void>(ErrorCode::RemoteService, "Failed to write chunk for " + staging_path.string());
    }
    return Ok();
}

Result<void> DirectoryTransport::publish(const fs::path& staging_path,
                                         const fs::path& destination_path,
                                         const std::string& expected_fingerprint) const {
    auto staged = fingerprinter_.fingerprint_file(staging_path);
    if (staged.is_error()) {
        return Err<void>(ErrorCode::RemoteService, staged.error().message);
    }
    if (staged.value() != expected_fingerprint) {
        return Err<void>(ErrorCode::RemoteService,
                         "Final fingerprint mismatch for " + destination_path.string() +
                         " (source changed during upload?)");
    }

    if (auto res = ensure_parent_exists(destination_path); res.is_error()) {
        return res;
    }

    std::error_code ec;
    fs::rename(staging_path, destination_path, ec);
    if (ec) {
        return Err<void>(ErrorCode::RemoteService,
                         "Failed to move staging file to " + destination_path.string() + ": " + ec.message());
    }
    return Ok();
}

Result<void> DirectoryTransport::ensure_parent_exists(const fs::path& path) {
    const auto parent = path.parent_path();
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec && !fs::is_directory(parent)) {
        return Err<void>(ErrorCode::RemoteService, "Failed to create directory: " + parent.string());
    }
    return Ok();
}

} // namespace bulkup::transport
