#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <zlib.h>
#include "invlens/common/md5.h"
#include "invlens/common/result.h"
#include "invlens/storage/object_store.h"

namespace invlens::inventory {

// ================================
// GzipSource: ObjectReader 之上的增量解压
// 支持多 member 的 gzip; 不是 gzip 的输入原样透传
// 同时对原始 (压缩) 字节计算 MD5
// ================================
class GzipSource {
public:
    GzipSource(std::unique_ptr<storage::ObjectReader> reader, size_t buffer_bytes);
    ~GzipSource();

    GzipSource(const GzipSource&) = delete;
    GzipSource& operator=(const GzipSource&) = delete;

    // 返回 0 表示 EOF
    Result<size_t> Read(char* out, size_t n);

    uint64_t raw_bytes() const { return raw_bytes_; }

    bool compressed() const { return gzip_; }

    // 只在读到 EOF 后调用
    std::string RawMd5() { return md5_.HexDigest(); }

private:
    Status Fill();
    Status Detect();
    Result<size_t> Inflate(char* out, size_t n);

    std::unique_ptr<storage::ObjectReader> reader_;
    std::vector<char> in_buf_;
    z_stream zs_{};
    Md5Digest md5_;

    uint64_t raw_bytes_ = 0;
    bool detected_ = false;
    bool gzip_ = false;
    bool inflate_inited_ = false;
    bool raw_eof_ = false;
    bool member_open_ = false;
};

} // namespace invlens::inventory
