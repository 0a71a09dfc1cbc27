// ================================
// Manifest 编解码
// JSON: S3 Inventory manifest.json
// Binary: 本地缓存 (RocksDB value)
// ================================

#include "invlens/inventory/manifest_codec.h"
#include "invlens/common/logger.h"
#include <nlohmann/json.hpp>
#include <limits>

namespace invlens::inventory {

using json = nlohmann::json;

namespace {

constexpr uint32_t kEncodingVersion = 1;

std::string TrimSpaces(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string StringField(const json& obj, const char* name) {
    auto it = obj.find(name);
    if (it == obj.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

// size 在 manifest 中是数字; 兼容字符串形式
bool ParseSize(const json& value, uint64_t* size) {
    if (value.is_number_unsigned()) {
        *size = value.get<uint64_t>();
        return true;
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v < 0) return false;
        *size = static_cast<uint64_t>(v);
        return true;
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) return false;
        uint64_t v = 0;
        for (char c : text) {
            if (c < '0' || c > '9') return false;
            if (v > (std::numeric_limits<uint64_t>::max() - (c - '0')) / 10) return false;
            v = v * 10 + (c - '0');
        }
        *size = v;
        return true;
    }
    return false;
}

Timestamp ParseCreationTimestamp(const json& obj) {
    auto it = obj.find("creationTimestamp");
    if (it == obj.end()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

// ================================
// 小端编码 helper
// ================================

class Writer {
public:
    void PutU32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            out_.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
        }
    }

    void PutU64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            out_.push_back(static_cast<char>((v >> (i * 8)) & 0xFF));
        }
    }

    void PutString(const std::string& s) {
        PutU32(static_cast<uint32_t>(s.size()));
        out_.append(s);
    }

    std::string Take() { return std::move(out_); }

private:
    std::string out_;
};

class Reader {
public:
    explicit Reader(const std::string& in, size_t offset = 0) : in_(in), pos_(offset) {}

    bool GetU32(uint32_t* v) {
        if (in_.size() - pos_ < 4) return false;
        *v = 0;
        for (int i = 0; i < 4; ++i) {
            *v |= static_cast<uint32_t>(static_cast<uint8_t>(in_[pos_ + i])) << (i * 8);
        }
        pos_ += 4;
        return true;
    }

    bool GetU64(uint64_t* v) {
        if (in_.size() - pos_ < 8) return false;
        *v = 0;
        for (int i = 0; i < 8; ++i) {
            *v |= static_cast<uint64_t>(static_cast<uint8_t>(in_[pos_ + i])) << (i * 8);
        }
        pos_ += 8;
        return true;
    }

    bool GetString(std::string* s) {
        uint32_t len = 0;
        if (!GetU32(&len) || in_.size() - pos_ < len) return false;
        s->assign(in_, pos_, len);
        pos_ += len;
        return true;
    }

    bool AtEnd() const { return pos_ == in_.size(); }

private:
    const std::string& in_;
    size_t pos_;
};

void WriteManifest(Writer& w, const Manifest& m) {
    w.PutU32(kEncodingVersion);
    w.PutString(m.source_bucket);
    w.PutString(m.destination_bucket);
    w.PutString(m.inventory_id);
    w.PutString(m.version);
    w.PutString(m.date);
    w.PutString(m.manifest_key);
    w.PutU64(m.creation_timestamp);
    w.PutU32(static_cast<uint32_t>(m.format));

    w.PutU32(static_cast<uint32_t>(m.schema.size()));
    for (const auto& column : m.schema) {
        w.PutString(column);
    }

    w.PutU32(static_cast<uint32_t>(m.files.size()));
    for (const auto& file : m.files) {
        w.PutString(file.key);
        w.PutU64(file.size);
        w.PutString(file.md5);
        w.PutU32(static_cast<uint32_t>(file.format));
    }
}

bool ReadFormat(Reader& r, FileFormat* format) {
    uint32_t v = 0;
    if (!r.GetU32(&v) || v > static_cast<uint32_t>(FileFormat::kParquet)) {
        return false;
    }
    *format = static_cast<FileFormat>(v);
    return true;
}

Result<Manifest> ReadManifest(Reader& r) {
    Manifest m;
    uint32_t version = 0;
    if (!r.GetU32(&version) || version != kEncodingVersion) {
        return Status::ManifestCorrupt("Unknown cached manifest encoding version");
    }

    bool ok = r.GetString(&m.source_bucket) &&
              r.GetString(&m.destination_bucket) &&
              r.GetString(&m.inventory_id) &&
              r.GetString(&m.version) &&
              r.GetString(&m.date) &&
              r.GetString(&m.manifest_key) &&
              r.GetU64(&m.creation_timestamp) &&
              ReadFormat(r, &m.format);

    uint32_t count = 0;
    ok = ok && r.GetU32(&count);
    for (uint32_t i = 0; ok && i < count; ++i) {
        std::string column;
        ok = r.GetString(&column);
        m.schema.push_back(std::move(column));
    }

    ok = ok && r.GetU32(&count);
    for (uint32_t i = 0; ok && i < count; ++i) {
        DataFileRef file;
        ok = r.GetString(&file.key) && r.GetU64(&file.size) &&
             r.GetString(&file.md5) && ReadFormat(r, &file.format);
        m.files.push_back(std::move(file));
    }

    if (!ok || !r.AtEnd()) {
        return Status::ManifestCorrupt("Truncated cached manifest");
    }
    return m;
}

} // namespace

std::vector<std::string> SplitSchema(const std::string& schema) {
    std::vector<std::string> columns;
    size_t start = 0;
    while (start <= schema.size()) {
        auto comma = schema.find(',', start);
        if (comma == std::string::npos) {
            comma = schema.size();
        }
        auto column = TrimSpaces(schema.substr(start, comma - start));
        if (!column.empty()) {
            columns.push_back(std::move(column));
        }
        start = comma + 1;
    }
    return columns;
}

Result<Manifest> ParseManifestJson(const std::string& text, const ManifestLocation& location) {
    auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Status::ManifestCorrupt(location.manifest_key + ": not a JSON object");
    }

    Manifest m;
    m.inventory_id = location.inventory_id;
    m.date = location.date;
    m.manifest_key = location.manifest_key;
    m.source_bucket = StringField(doc, "sourceBucket");
    m.destination_bucket = StringField(doc, "destinationBucket");
    m.version = StringField(doc, "version");
    m.creation_timestamp = ParseCreationTimestamp(doc);

    auto format_text = StringField(doc, "fileFormat");
    if (format_text.empty()) {
        m.format = FileFormat::kCSV;
    } else {
        auto format = ParseFileFormat(format_text);
        if (format.hasError()) {
            return Status::ManifestCorrupt(location.manifest_key + ": " + format.error().message());
        }
        m.format = format.value();
    }

    m.schema = SplitSchema(StringField(doc, "fileSchema"));
    if (m.schema.empty()) {
        return Status::ManifestCorrupt(location.manifest_key + ": missing fileSchema");
    }
    if (m.ColumnIndex("Key") < 0) {
        return Status::ManifestCorrupt(location.manifest_key + ": fileSchema has no Key column");
    }

    auto files = doc.find("files");
    if (files == doc.end() || !files->is_array()) {
        return Status::ManifestCorrupt(location.manifest_key + ": missing files list");
    }

    m.files.reserve(files->size());
    for (const auto& entry : *files) {
        if (!entry.is_object()) {
            return Status::ManifestCorrupt(location.manifest_key + ": file entry is not an object");
        }
        DataFileRef ref;
        ref.key = StringField(entry, "key");
        if (ref.key.empty()) {
            return Status::ManifestCorrupt(location.manifest_key + ": file entry without key");
        }
        auto size = entry.find("size");
        if (size != entry.end() && !ParseSize(*size, &ref.size)) {
            return Status::ManifestCorrupt(location.manifest_key + ": invalid size for " + ref.key);
        }
        ref.md5 = StringField(entry, "MD5checksum");
        ref.format = m.format;
        m.files.push_back(std::move(ref));
    }

    LOG_DEBUG("Parsed manifest {}: {} files, {} columns, format {}",
              location.manifest_key, m.files.size(), m.schema.size(), FileFormatName(m.format));
    return m;
}

std::string EncodeManifest(const Manifest& manifest) {
    Writer w;
    WriteManifest(w, manifest);
    return w.Take();
}

std::string EncodeCacheValue(Timestamp cached_at, const Manifest& manifest) {
    Writer w;
    w.PutU64(cached_at);
    WriteManifest(w, manifest);
    return w.Take();
}

Result<Manifest> DecodeCacheValue(const std::string& value, Timestamp* cached_at) {
    Reader r(value);
    if (!r.GetU64(cached_at)) {
        return Status::ManifestCorrupt("Truncated cache value");
    }
    return ReadManifest(r);
}

} // namespace invlens::inventory
