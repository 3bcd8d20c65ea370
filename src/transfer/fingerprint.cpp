#include "bulkup/transfer/fingerprint.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

namespace bulkup::transfer {
namespace fs = std::filesystem;

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string hex_encode(const unsigned char* data, unsigned int len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

Result<EvpMdCtxPtr> start_digest(const std::string& algorithm) {
    const EVP_MD* md = EVP_get_digestbyname(algorithm.c_str());
    if (md == nullptr) {
        return Err<EvpMdCtxPtr>(ErrorCode::InvalidArgument, "Unknown digest algorithm: " + algorithm);
    }

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Err<EvpMdCtxPtr>(ErrorCode::Io, std::string("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return Err<EvpMdCtxPtr>(ErrorCode::Io, "EVP_DigestInit_ex failed for " + algorithm);
    }
    return Ok(std::move(ctx));
}

Result<std::string> finish_digest(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx, out, &out_len) != 1) {
        return Err<std::string>(ErrorCode::Io, std::string("EVP_DigestFinal_ex failed"));
    }
    return Ok(hex_encode(out, out_len));
}

} // namespace

ContentFingerprinter::ContentFingerprinter(std::string algorithm)
    : algorithm_(std::move(algorithm)) {}

bool ContentFingerprinter::available() const {
    return EVP_get_digestbyname(algorithm_.c_str()) != nullptr;
}

Result<std::string> ContentFingerprinter::fingerprint_file(const fs::path& path) const {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<std::string>(ErrorCode::File, "Failed to open file for hashing: " + path.string());
    }

    auto ctx = start_digest(algorithm_);
    if (ctx.is_error()) {
        return Err<std::string>(ctx.error());
    }

    std::vector<char> buffer(kReadBufferSize);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(ctx.value().get(), buffer.data(), count) != 1) {
            return Err<std::string>(ErrorCode::Io, "EVP_DigestUpdate failed for " + path.string());
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorCode::File, "Read error while hashing " + path.string());
    }

    return finish_digest(ctx.value().get());
}

Result<std::string> ContentFingerprinter::fingerprint_bytes(std::string_view data) const {
    auto ctx = start_digest(algorithm_);
    if (ctx.is_error()) {
        return Err<std::string>(ctx.error());
    }
    if (EVP_DigestUpdate(ctx.value().get(), data.data(), data.size()) != 1) {
        return Err<std::string>(ErrorCode::Io, std::string("EVP_DigestUpdate failed"));
    }
    return finish_digest(ctx.value().get());
}

} // namespace bulkup::transfer
