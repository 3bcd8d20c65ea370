#include "bulkup/transfer/candidate.hpp"

#include "bulkup/transfer/fingerprint.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_map>

namespace bulkup::transfer {
namespace fs = std::filesystem;

namespace {

Timestamp to_system_time(fs::file_time_type time) {
    using namespace std::chrono;
    return time_point_cast<Clock::duration>(time - fs::file_time_type::clock::now() + Clock::now());
}

const std::unordered_map<std::string, std::string>& media_types() {
    static const std::unordered_map<std::string, std::string> table{
        {".txt", "text/plain"},
        {".text", "text/plain"},
        {".csv", "text/csv"},
        {".md", "text/markdown"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".xml", "text/xml"},
        {".py", "text/x-python"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".h5", "application/x-hdf5"},
        {".hdf5", "application/x-hdf5"},
        {".sh", "application/x-sh"},
        {".exe", "application/x-msdownload"},
        {".dll", "application/x-msdownload"},
        {".com", "application/x-msdos-program"},
        {".bat", "application/x-msdos-program"},
        {".msi", "application/x-msi"},
        {".bin", "application/octet-stream"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".tif", "image/tiff"},
        {".tiff", "image/tiff"},
        {".wav", "audio/x-wav"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"},
    };
    return table;
}

} // namespace

CandidateFile::CandidateFile(fs::path local_path,
                             std::string name,
                             std::string directory,
                             std::uint64_t size,
                             std::string media_type,
                             std::string permissions,
                             Timestamp updated_at)
    : local_path_(std::move(local_path)),
      name_(std::move(name)),
      directory_(std::move(directory)),
      size_(size),
      media_type_(std::move(media_type)),
      permissions_(std::move(permissions)),
      updated_at_(updated_at) {}

std::string CandidateFile::relative_path() const {
    if (directory_.empty() || directory_ == ".") {
        return name_;
    }
    return directory_ + "/" + name_;
}

Result<std::string> CandidateFile::fingerprint(const ContentFingerprinter& fingerprinter) const {
    return fingerprinter.fingerprint_file(local_path_);
}

Result<CandidateRef> build_candidate(const fs::path& root, const fs::path& file) {
    std::error_code ec;
    const fs::path resolved = fs::canonical(file, ec);
    if (ec) {
        return Err<CandidateRef>(ErrorCode::File, "Cannot resolve " + file.string() + ": " + ec.message());
    }

    const auto status = fs::status(resolved, ec);
    if (ec) {
        return Err<CandidateRef>(ErrorCode::File, "Cannot stat " + file.string() + ": " + ec.message());
    }

    std::uint64_t size = 0;
    Timestamp updated_at{};
    if (fs::is_regular_file(status)) {
        size = fs::file_size(resolved, ec);
        if (ec) {
            return Err<CandidateRef>(ErrorCode::File, "Cannot read size of " + file.string() + ": " + ec.message());
        }
        const auto write_time = fs::last_write_time(resolved, ec);
        if (!ec) {
            updated_at = to_system_time(write_time);
        }
    }

    // Relative location is taken from the path as walked, not the resolved
    // target, so symlinked files keep their place in the tree
    const fs::path absolute_file = fs::absolute(file, ec).lexically_normal();
    const fs::path absolute_root = fs::absolute(root, ec).lexically_normal();
    const fs::path relative = absolute_file.lexically_relative(absolute_root);
    if (ec || relative.empty() || *relative.begin() == "..") {
        return Err<CandidateRef>(ErrorCode::InvalidArgument, file.string() + " is not under " + root.string());
    }

    std::string directory = relative.parent_path().generic_string();
    if (directory.empty()) {
        directory = ".";
    }

    return Ok<CandidateRef>(std::make_shared<const CandidateFile>(
        resolved,
        file.filename().string(),
        std::move(directory),
        size,
        guess_media_type(file),
        permission_string(status.permissions()),
        updated_at));
}

std::string guess_media_type(const fs::path& file) {
    std::string extension = file.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto& table = media_types();
    if (auto it = table.find(extension); it != table.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string permission_string(fs::perms perms) {
    static constexpr struct {
        fs::perms bit;
        char symbol;
    } kBits[] = {
        {fs::perms::owner_read, 'r'}, {fs::perms::owner_write, 'w'}, {fs::perms::owner_exec, 'x'},
        {fs::perms::group_read, 'r'}, {fs::perms::group_write, 'w'}, {fs::perms::group_exec, 'x'},
        {fs::perms::others_read, 'r'}, {fs::perms::others_write, 'w'}, {fs::perms::others_exec, 'x'},
    };

    std::string out;
    out.reserve(9);
    for (const auto& entry : kBits) {
        out.push_back((perms & entry.bit) != fs::perms::none ? entry.symbol : '-');
    }
    return out;
}

} // namespace bulkup::transfer
