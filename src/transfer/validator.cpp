#include "bulkup/transfer/validator.hpp"

#include "bulkup/core/config.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace bulkup::transfer {
namespace fs = std::filesystem;

DefaultFileValidator::DefaultFileValidator()
    : DefaultFileValidator(TransferConfig::default_disallowed_media_types()) {}

DefaultFileValidator::DefaultFileValidator(const std::vector<std::string>& disallowed_media_types)
    : disallowed_(disallowed_media_types.begin(), disallowed_media_types.end()) {}

ValidationVerdict DefaultFileValidator::validate(const CandidateFile& candidate) const {
    ValidationVerdict verdict;

    if (disallowed_.count(candidate.media_type()) > 0) {
        verdict.reasons.push_back("Invalid MIME type: " + candidate.media_type());
    }

    std::error_code ec;
    const bool regular = fs::is_regular_file(candidate.local_path(), ec);
    if (!regular) {
        verdict.reasons.emplace_back("Not a file");
    } else if (candidate.size() == 0) {
        verdict.reasons.emplace_back("Empty file");
    } else {
        std::ifstream input(candidate.local_path(), std::ios::binary);
        if (!input) {
            verdict.reasons.emplace_back("Unreadable file");
        }
    }

    verdict.valid = verdict.reasons.empty();
    return verdict;
}

} // namespace bulkup::transfer
