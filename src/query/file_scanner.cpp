#include "invlens/query/file_scanner.h"
#include "invlens/common/logger.h"
#include <sstream>

namespace invlens::query {

// ================================
// ScanSummary / MatchMode
// ================================

std::string ScanSummary::ToString() const {
    std::ostringstream oss;
    oss << "files " << files_scanned << "/" << files_total
        << ", failed " << files_failed
        << ", rows " << rows_scanned
        << ", malformed " << malformed_rows;
    if (checksum_mismatches > 0) {
        oss << ", checksum mismatches " << checksum_mismatches;
    }
    if (cancelled) {
        oss << " (cancelled)";
    }
    return oss.str();
}

const char* MatchModeName(MatchMode mode) {
    switch (mode) {
        case MatchMode::kSubstring: return "substring";
        case MatchMode::kPrefix: return "prefix";
        case MatchMode::kExactFolder: return "folder";
    }
    return "unknown";
}

Result<MatchMode> ParseMatchMode(const std::string& text) {
    if (text == "substring") return MatchMode::kSubstring;
    if (text == "prefix") return MatchMode::kPrefix;
    if (text == "folder" || text == "exact-folder") return MatchMode::kExactFolder;
    return Status::InvalidArgument("Unknown match mode: " + text);
}

// ================================
// 单文件扫描
// ================================

FileOutcome ScanFile(storage::ObjectStore& store,
                     const std::string& bucket,
                     const inventory::DataFileRef& file,
                     const inventory::RecordSchema& schema,
                     const ScanOptions& options,
                     const CancellationToken& token,
                     const RecordCallback& callback) {
    FileOutcome outcome;
    if (token.IsCancelled()) {
        outcome.status = Status::QueryCancelled();
        return outcome;
    }

    auto stream = inventory::RecordStream::Open(store, bucket, file, schema,
                                                options.reader, options.retry);
    if (stream.hasError()) {
        LOG_ERROR("Cannot open data file {}/{}: {}", bucket, file.key, stream.error().ToString());
        outcome.status = stream.error();
        return outcome;
    }

    auto& reader = *stream.value();
    inventory::InventoryRecord record;
    while (true) {
        if (token.IsCancelled()) {
            outcome.status = Status::QueryCancelled();
            break;
        }
        auto more = reader.Next(&record);
        if (more.hasError()) {
            outcome.status = more.error();
            break;
        }
        if (!more.value()) {
            outcome.completed = true;
            break;
        }
        if (!callback(std::move(record))) {
            outcome.status = Status::QueryCancelled();
            break;
        }
    }
    outcome.stats = reader.stats();
    return outcome;
}

Status CheckScannable(const inventory::Manifest& manifest) {
    if (manifest.format != inventory::FileFormat::kCSV) {
        return Status::Unsupported(std::string("Cannot stream ") +
                                   inventory::FileFormatName(manifest.format) +
                                   " inventory data files");
    }
    return Status::Ok();
}

void AccumulateFile(ScanSummary* summary,
                    const inventory::DataFileRef& file,
                    const FileOutcome& outcome) {
    summary->rows_scanned += outcome.stats.rows_read;
    summary->malformed_rows += outcome.stats.malformed_rows;
    summary->bytes_read += outcome.stats.bytes_read;

    if (outcome.stats.checksum_mismatch) {
        ++summary->checksum_mismatches;
        summary->warnings.push_back(file.key + ": checksum mismatch");
    }
    if (outcome.completed) {
        ++summary->files_scanned;
    } else if (outcome.status.code() != ErrorCode::kQueryCancelled) {
        ++summary->files_failed;
        summary->warnings.push_back(file.key + ": " + outcome.status.ToString());
    }
}

} // namespace invlens::query
