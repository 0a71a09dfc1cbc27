// ================================
// 数据文件记录流
// ================================

#include "invlens/inventory/record_reader.h"
#include "invlens/common/logger.h"
#include "invlens/inventory/csv.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

namespace invlens::inventory {

namespace {

bool ParseUnsigned(const std::string& text, uint64_t* value) {
    uint64_t v = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        if (v > (std::numeric_limits<uint64_t>::max() - (c - '0')) / 10) {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    *value = v;
    return true;
}

bool ParseFlag(const std::string& text, bool fallback) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "true") return true;
    if (lower == "false") return false;
    return fallback;
}

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

// ================================
// RecordSchema
// ================================

Result<RecordSchema> RecordSchema::FromColumns(const std::vector<std::string>& columns) {
    RecordSchema schema;
    schema.columns_ = columns;
    bool has_key = false;

    for (size_t i = 0; i < columns.size(); ++i) {
        const auto& name = columns[i];
        Field field = Field::kExtra;
        if (name == "Bucket") field = Field::kBucket;
        else if (name == "Key") field = Field::kKey;
        else if (name == "Size") field = Field::kSize;
        else if (name == "LastModifiedDate") field = Field::kLastModified;
        else if (name == "StorageClass") field = Field::kStorageClass;
        else if (name == "ETag") field = Field::kETag;
        else if (name == "VersionId") field = Field::kVersionId;
        else if (name == "IsLatest") field = Field::kIsLatest;
        else if (name == "IsDeleteMarker") field = Field::kIsDeleteMarker;

        if (field == Field::kKey) has_key = true;
        if (field == Field::kKey || field == Field::kSize) {
            schema.required_fields_ = std::max(schema.required_fields_, i + 1);
        }
        schema.fields_.push_back(field);
    }

    if (!has_key) {
        return Status::ManifestCorrupt("Schema has no Key column");
    }
    return schema;
}

Status RecordSchema::Decode(const std::vector<std::string>& fields,
                            bool decode_keys,
                            InventoryRecord* record) const {
    if (fields.size() < required_fields_) {
        return Status::RecordFormatError("expected at least " + std::to_string(required_fields_) +
                                         " columns, got " + std::to_string(fields.size()));
    }

    *record = InventoryRecord();
    static const std::string kEmpty;
    for (size_t i = 0; i < fields_.size(); ++i) {
        // 缺少的可选尾列按空值处理; 多出的尾列忽略
        const std::string& value = i < fields.size() ? fields[i] : kEmpty;
        switch (fields_[i]) {
            case Field::kBucket:
                record->bucket = value;
                break;
            case Field::kKey:
                if (value.empty()) {
                    return Status::RecordFormatError("empty key");
                }
                if (decode_keys) {
                    if (!UrlDecode(value, &record->key)) {
                        return Status::RecordFormatError("bad URL escape in key: " + value);
                    }
                } else {
                    record->key = value;
                }
                break;
            case Field::kSize:
                // 删除标记没有 size
                if (!value.empty() && !ParseUnsigned(value, &record->size)) {
                    return Status::RecordFormatError("invalid size: " + value);
                }
                break;
            case Field::kLastModified:
                record->last_modified = value;
                break;
            case Field::kStorageClass:
                record->storage_class = value;
                break;
            case Field::kETag:
                record->etag = value;
                break;
            case Field::kVersionId:
                record->version_id = value;
                break;
            case Field::kIsLatest:
                record->is_latest = ParseFlag(value, true);
                break;
            case Field::kIsDeleteMarker:
                record->is_delete_marker = ParseFlag(value, false);
                break;
            case Field::kExtra:
                record->extra.emplace_back(columns_[i], value);
                break;
        }
    }
    return Status::Ok();
}

// ================================
// RecordStream
// ================================

RecordStream::RecordStream(std::unique_ptr<storage::ObjectReader> reader,
                           DataFileRef file,
                           RecordSchema schema,
                           ReaderOptions options)
    : source_(std::move(reader), options.buffer_bytes),
      file_(std::move(file)),
      schema_(std::move(schema)),
      options_(options),
      buf_(options.buffer_bytes ? options.buffer_bytes : 64 * 1024) {}

Result<std::unique_ptr<RecordStream>> RecordStream::Open(storage::ObjectStore& store,
                                                         const std::string& bucket,
                                                         const DataFileRef& file,
                                                         const RecordSchema& schema,
                                                         const ReaderOptions& options,
                                                         const storage::RetryPolicy& policy) {
    auto reader = storage::FetchWithRetry(policy, bucket + "/" + file.key,
                                          [&] { return store.GetObject(bucket, file.key); });
    if (reader.hasError()) {
        return reader.error();
    }
    return std::make_unique<RecordStream>(std::move(reader).value(), file, schema, options);
}

Result<bool> RecordStream::NextLine(std::string* line) {
    line->clear();
    while (true) {
        if (buf_pos_ < buf_len_) {
            const char* begin = buf_.data() + buf_pos_;
            const char* nl = static_cast<const char*>(std::memchr(begin, '\n', buf_len_ - buf_pos_));
            if (nl) {
                line->append(begin, nl);
                buf_pos_ += (nl - begin) + 1;
                if (!line->empty() && line->back() == '\r') {
                    line->pop_back();
                }
                return true;
            }
            line->append(begin, buf_len_ - buf_pos_);
            buf_pos_ = buf_len_;
        }

        if (eof_) {
            if (!line->empty() && line->back() == '\r') {
                line->pop_back();
            }
            return !line->empty();
        }

        auto n = source_.Read(buf_.data(), buf_.size());
        stats_.bytes_read = source_.raw_bytes();
        if (n.hasError()) {
            return n.error();
        }
        buf_pos_ = 0;
        buf_len_ = n.value();
        if (buf_len_ == 0) {
            eof_ = true;
        }
    }
}

void RecordStream::Finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    stats_.bytes_read = source_.raw_bytes();

    if (!options_.verify_checksum || file_.md5.empty()) {
        return;
    }
    auto actual = source_.RawMd5();
    if (actual == ToLower(file_.md5)) {
        stats_.checksum_verified = true;
    } else {
        stats_.checksum_mismatch = true;
        LOG_WARN("Checksum mismatch for data file {}: manifest {}, read {}",
                 file_.key, file_.md5, actual);
    }
}

Result<bool> RecordStream::Next(InventoryRecord* record) {
    std::string line;
    while (true) {
        auto more = NextLine(&line);
        if (more.hasError()) {
            LOG_ERROR("Failed to read data file {}: {}", file_.key, more.error().ToString());
            return more.error();
        }
        if (!more.value()) {
            Finish();
            return false;
        }
        if (line.empty()) {
            continue;
        }

        ++stats_.rows_read;
        Status st;
        if (!ParseCsvLine(line, &fields_)) {
            st = Status::RecordFormatError("unterminated quoted field");
        } else {
            st = schema_.Decode(fields_, options_.decode_keys, record);
        }
        if (st.OK()) {
            consecutive_malformed_ = 0;
            return true;
        }

        ++stats_.malformed_rows;
        ++consecutive_malformed_;
        LOG_WARN("Skipping malformed row {} in {}: {}", stats_.rows_read, file_.key, st.message());
        if (consecutive_malformed_ >= options_.max_consecutive_malformed) {
            LOG_ERROR("Giving up on {} after {} consecutive malformed rows",
                      file_.key, consecutive_malformed_);
            return Status::RecordStreamCorrupt(file_.key + ": " +
                                               std::to_string(consecutive_malformed_) +
                                               " consecutive malformed rows");
        }
    }
}

} // namespace invlens::inventory
