#include "invlens/common/md5.h"
#include <openssl/evp.h>

namespace invlens {

Md5Digest::Md5Digest() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_) {
        EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr);
    }
}

Md5Digest::~Md5Digest() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
    }
}

void Md5Digest::Update(const void* data, size_t size) {
    if (ctx_ && !finished_ && size > 0) {
        EVP_DigestUpdate(ctx_, data, size);
    }
}

std::string Md5Digest::HexDigest() {
    if (!ctx_ || finished_) {
        return "";
    }
    finished_ = true;

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_DigestFinal_ex(ctx_, digest, &digest_len);

    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

std::string Md5Digest::Hex(const std::string& data) {
    Md5Digest md5;
    md5.Update(data.data(), data.size());
    return md5.HexDigest();
}

} // namespace invlens
