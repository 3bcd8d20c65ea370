#pragma once

#include "bulkup/core/time.hpp"
#include "bulkup/transfer/candidate.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bulkup::transfer {

/**
 * @brief A path left out of the transfer queue, with the reasons why
 */
struct SkipRecord {
    std::filesystem::path path;
    std::vector<std::string> reasons;
};

/**
 * @brief Candidate whose transfer attempt did not succeed
 */
struct FailureRecord {
    CandidateRef candidate;
    std::optional<std::string> reason;
};

/**
 * @brief What the transport reports back for a successful upload
 */
struct TransferReceipt {
    std::string remote_id;
    std::string remote_path;
    std::uint64_t bytes_transferred = 0;
    std::string fingerprint;  ///< Empty when the transport does not report one
};

struct CompletedTransfer {
    CandidateRef candidate;
    TransferReceipt receipt;
    Timestamp completed_at{};
};

/**
 * @brief Point-in-time sizes of every workload buffer
 */
struct WorkloadCounts {
    std::size_t discovered = 0;
    std::size_t pending = 0;
    std::size_t in_progress = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;
};

inline constexpr const char* kAlreadyUploadedReason = "already uploaded, unchanged";

} // namespace bulkup::transfer
