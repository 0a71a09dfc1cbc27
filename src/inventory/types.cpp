#include "invlens/inventory/types.h"
#include <algorithm>
#include <cctype>

namespace invlens::inventory {

const char* FileFormatName(FileFormat format) {
    switch (format) {
        case FileFormat::kCSV: return "CSV";
        case FileFormat::kORC: return "ORC";
        case FileFormat::kParquet: return "Parquet";
    }
    return "Unknown";
}

Result<FileFormat> ParseFileFormat(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "csv") return FileFormat::kCSV;
    if (lower == "orc") return FileFormat::kORC;
    if (lower == "parquet") return FileFormat::kParquet;
    return Status::InvalidArgument("Unknown inventory file format: " + text);
}

std::string InventoryConfig::ManifestRoot() const {
    std::string root;
    if (!destination_prefix.empty()) {
        root = destination_prefix;
        if (root.back() != '/') {
            root.push_back('/');
        }
    }
    root += source_bucket + "/" + inventory_id + "/";
    return root;
}

InventoryConfig InventoryConfig::Default(const std::string& bucket,
                                         const std::string& inventory_id) {
    InventoryConfig config;
    config.source_bucket = bucket;
    config.inventory_id = inventory_id;
    config.destination_bucket = bucket;
    return config;
}

uint64_t Manifest::TotalBytes() const {
    uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    return total;
}

int Manifest::ColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < schema.size(); ++i) {
        if (schema[i] == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

// ================================
// 时间戳格式
// ================================

namespace {

bool DigitsAt(const std::string& text, size_t pos, size_t count) {
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

bool IsManifestDay(const std::string& text) {
    return text.size() == 10 &&
           DigitsAt(text, 0, 4) && text[4] == '-' &&
           DigitsAt(text, 5, 2) && text[7] == '-' &&
           DigitsAt(text, 8, 2);
}

bool IsManifestStamp(const std::string& text) {
    // 2024-01-05T01-00Z
    return text.size() == 17 &&
           IsManifestDay(text.substr(0, 10)) &&
           text[10] == 'T' &&
           DigitsAt(text, 11, 2) && text[13] == '-' &&
           DigitsAt(text, 14, 2) && text[16] == 'Z';
}

} // namespace invlens::inventory
