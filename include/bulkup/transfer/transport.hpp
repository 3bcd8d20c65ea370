#pragma once

#include "bulkup/core/result.hpp"
#include "bulkup/transfer/candidate.hpp"
#include "bulkup/transfer/types.hpp"

namespace bulkup::transfer {

/**
 * @brief The only way the engine moves bytes to the remote side
 *
 * Implementations must be safe to call from several worker threads at once.
 * Failures use ErrorCode::Authentication, Network, RemoteService or File;
 * the engine records Error::message as the per-file reason and never
 * branches on the code.
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual Outcome<TransferReceipt> upload(const CandidateFile& candidate) = 0;
};

} // namespace bulkup::transfer
