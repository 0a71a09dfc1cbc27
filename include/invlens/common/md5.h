#pragma once

#include <cstddef>
#include <string>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace invlens {

// ================================
// 增量 MD5 (OpenSSL EVP)
// ================================
class Md5Digest {
public:
    Md5Digest();
    ~Md5Digest();

    Md5Digest(const Md5Digest&) = delete;
    Md5Digest& operator=(const Md5Digest&) = delete;

    void Update(const void* data, size_t size);

    // 小写十六进制, 调用后不能再 Update
    std::string HexDigest();

    static std::string Hex(const std::string& data);

private:
    EVP_MD_CTX* ctx_;
    bool finished_ = false;
};

} // namespace invlens
