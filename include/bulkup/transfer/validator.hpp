#pragma once

#include "bulkup/transfer/candidate.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace bulkup::transfer {

struct ValidationVerdict {
    bool valid = true;
    std::vector<std::string> reasons;  ///< Populated when !valid
};

/**
 * @brief Policy deciding whether a candidate may be uploaded
 */
class FileValidator {
public:
    virtual ~FileValidator() = default;
    virtual ValidationVerdict validate(const CandidateFile& candidate) const = 0;
};

/**
 * @brief Rejects non-regular, empty and unreadable files, and media types on a deny list
 *
 * The same checks run on the service side, so files rejected here would not
 * be accepted remotely either.
 */
class DefaultFileValidator : public FileValidator {
public:
    DefaultFileValidator();
    explicit DefaultFileValidator(const std::vector<std::string>& disallowed_media_types);

    ValidationVerdict validate(const CandidateFile& candidate) const override;

private:
    std::unordered_set<std::string> disallowed_;
};

} // namespace bulkup::transfer
