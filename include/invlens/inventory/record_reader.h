#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "invlens/common/result.h"
#include "invlens/config/engine_config.h"
#include "invlens/inventory/gzip_source.h"
#include "invlens/inventory/types.h"
#include "invlens/storage/object_store.h"
#include "invlens/storage/retry.h"

namespace invlens::inventory {

struct ReaderOptions {
    uint32_t max_consecutive_malformed = 10;
    size_t buffer_bytes = 64 * 1024;
    bool decode_keys = true;
    bool verify_checksum = true;

    static ReaderOptions FromConfig(const config::ReaderConfig& cfg) {
        ReaderOptions opts;
        opts.max_consecutive_malformed = cfg.max_consecutive_malformed();
        opts.buffer_bytes = cfg.read_buffer_bytes();
        opts.decode_keys = cfg.decode_keys();
        opts.verify_checksum = cfg.verify_checksums();
        return opts;
    }
};

// ================================
// RecordSchema: 列名 -> 字段位置
// 未知列保留在 InventoryRecord::extra
// ================================
class RecordSchema {
public:
    static Result<RecordSchema> FromColumns(const std::vector<std::string>& columns);

    // 解码一行; 失败返回 kRecordFormatError
    Status Decode(const std::vector<std::string>& fields,
                  bool decode_keys,
                  InventoryRecord* record) const;

private:
    enum class Field {
        kBucket,
        kKey,
        kSize,
        kLastModified,
        kStorageClass,
        kETag,
        kVersionId,
        kIsLatest,
        kIsDeleteMarker,
        kExtra,
    };

    std::vector<std::string> columns_;
    std::vector<Field> fields_;
    size_t required_fields_ = 0;    // Key/Size 中最靠后的列 + 1
};

struct StreamStats {
    uint64_t rows_read = 0;
    uint64_t malformed_rows = 0;
    uint64_t bytes_read = 0;        // 压缩后的字节数
    bool checksum_verified = false;
    bool checksum_mismatch = false;
};

// ================================
// RecordStream: 单个数据文件的惰性记录序列
// 逐块解压, 逐行解析; 不可重启
// 坏行计数后跳过, 连续坏行达到阈值返回 kRecordStreamCorrupt
// ================================
class RecordStream {
public:
    RecordStream(std::unique_ptr<storage::ObjectReader> reader,
                 DataFileRef file,
                 RecordSchema schema,
                 ReaderOptions options);

    // 打开数据文件 (只对打开做重试)
    static Result<std::unique_ptr<RecordStream>> Open(storage::ObjectStore& store,
                                                      const std::string& bucket,
                                                      const DataFileRef& file,
                                                      const RecordSchema& schema,
                                                      const ReaderOptions& options,
                                                      const storage::RetryPolicy& policy);

    // true: record 有效; false: 文件结束
    Result<bool> Next(InventoryRecord* record);

    const StreamStats& stats() const { return stats_; }

private:
    Result<bool> NextLine(std::string* line);
    void Finish();

    GzipSource source_;
    DataFileRef file_;
    RecordSchema schema_;
    ReaderOptions options_;
    StreamStats stats_;

    std::vector<char> buf_;
    size_t buf_pos_ = 0;
    size_t buf_len_ = 0;
    bool eof_ = false;
    bool finished_ = false;
    uint32_t consecutive_malformed_ = 0;
    std::vector<std::string> fields_;
};

} // namespace invlens::inventory
