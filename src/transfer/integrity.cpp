#include "integrity.hpp"
#include <core/constants.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <cctype>
#include <memory>
#include <vector>

namespace {

struct DigestCtxFree {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestCtx = std::unique_ptr<EVP_MD_CTX, DigestCtxFree>;

std::string openssl_error(const char* function) {
    unsigned long code = ERR_get_error();
    if (code == 0) return std::string(function) + " failed";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(function) + ": " + buf;
}

std::string to_hex(const unsigned char* digest, unsigned int len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out.push_back(digits[digest[i] >> 4]);
        out.push_back(digits[digest[i] & 0x0f]);
    }
    return out;
}

} // namespace

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) return "";
    return to_hex(digest, len);
}

Result<std::string> sha256_local(LocalStorage& storage, const std::string& path) {
    using R = Result<std::string>;

    DigestCtx ctx(EVP_MD_CTX_new());
    if (!ctx) return R::Err(ErrorKind::IntegrityError, "sha256", path, "EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return R::Err(ErrorKind::IntegrityError, "sha256", path, openssl_error("EVP_DigestInit_ex"));
    }

    auto opened = storage.open(path, LocalStorage::Mode::Read);
    if (opened.is_err()) return R::Err(opened.error);
    auto& file = opened.value;

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    for (;;) {
        auto n = file->read(buf.data(), buf.size());
        if (n.is_err()) return R::Err(n.error);
        if (n.value == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), n.value) != 1) {
            return R::Err(ErrorKind::IntegrityError, "sha256", path, openssl_error("EVP_DigestUpdate"));
        }
    }
    auto closed = file->close();
    if (closed.is_err()) return R::Err(closed.error);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        return R::Err(ErrorKind::IntegrityError, "sha256", path, openssl_error("EVP_DigestFinal_ex"));
    }
    return R::Ok(to_hex(digest, len));
}

std::optional<std::string> parse_sha256_output(const std::string& output) {
    size_t start = output.find_first_not_of(" \t\r\n\\");
    if (start == std::string::npos || output.size() - start < 64) return std::nullopt;

    std::string digest;
    for (size_t i = start; i < start + 64; i++) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(output[i])));
        if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        digest.push_back(c);
    }
    if (start + 64 < output.size() && !std::isspace(static_cast<unsigned char>(output[start + 64]))) {
        return std::nullopt;
    }
    return digest;
}
