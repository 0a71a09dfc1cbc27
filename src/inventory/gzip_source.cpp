#include "invlens/inventory/gzip_source.h"
#include "invlens/common/result_macros.h"
#include <algorithm>
#include <cstring>

namespace invlens::inventory {

namespace {

// 15 位窗口 + 32: 自动识别 gzip/zlib 头
constexpr int kWindowBits = 15 + 32;

} // namespace

GzipSource::GzipSource(std::unique_ptr<storage::ObjectReader> reader, size_t buffer_bytes)
    : reader_(std::move(reader)),
      in_buf_(buffer_bytes ? buffer_bytes : 64 * 1024) {}

GzipSource::~GzipSource() {
    if (inflate_inited_) {
        inflateEnd(&zs_);
    }
}

Status GzipSource::Fill() {
    auto n = reader_->Read(in_buf_.data(), in_buf_.size());
    if (n.hasError()) {
        return n.error();
    }
    if (n.value() == 0) {
        raw_eof_ = true;
    }
    md5_.Update(in_buf_.data(), n.value());
    raw_bytes_ += n.value();
    zs_.next_in = reinterpret_cast<Bytef*>(in_buf_.data());
    zs_.avail_in = static_cast<uInt>(n.value());
    return Status::Ok();
}

Status GzipSource::Detect() {
    detected_ = true;
    RETURN_IF_NOT_OK(Fill());
    gzip_ = zs_.avail_in >= 2 &&
            static_cast<unsigned char>(in_buf_[0]) == 0x1f &&
            static_cast<unsigned char>(in_buf_[1]) == 0x8b;
    if (!gzip_) {
        return Status::Ok();
    }
    if (inflateInit2(&zs_, kWindowBits) != Z_OK) {
        return Status::IO("inflateInit2 failed");
    }
    inflate_inited_ = true;
    return Status::Ok();
}

Result<size_t> GzipSource::Read(char* out, size_t n) {
    if (!detected_) {
        RETURN_IF_NOT_OK(Detect());
    }
    if (n == 0) {
        return size_t{0};
    }
    if (gzip_) {
        return Inflate(out, n);
    }

    // 透传: 先吐出探测时读入的数据
    if (zs_.avail_in > 0) {
        size_t take = std::min<size_t>(n, zs_.avail_in);
        std::memcpy(out, zs_.next_in, take);
        zs_.next_in += take;
        zs_.avail_in -= static_cast<uInt>(take);
        return take;
    }
    if (raw_eof_) {
        return size_t{0};
    }
    RETURN_IF_NOT_OK(Fill());
    return Read(out, n);
}

Result<size_t> GzipSource::Inflate(char* out, size_t n) {
    zs_.next_out = reinterpret_cast<Bytef*>(out);
    zs_.avail_out = static_cast<uInt>(n);

    while (zs_.avail_out == n) {
        if (zs_.avail_in == 0) {
            if (raw_eof_) {
                if (member_open_) {
                    return Status::RecordStreamCorrupt("Truncated gzip stream");
                }
                break;
            }
            RETURN_IF_NOT_OK(Fill());
            continue;
        }

        member_open_ = true;
        int ret = inflate(&zs_, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            // 多 member: 重置后继续解后面的 member
            member_open_ = false;
            inflateReset(&zs_);
            continue;
        }
        if (ret != Z_OK && ret != Z_BUF_ERROR) {
            return Status::RecordStreamCorrupt(std::string("gzip: ") +
                                               (zs_.msg ? zs_.msg : "inflate failed"));
        }
    }
    return n - zs_.avail_out;
}

} // namespace invlens::inventory
