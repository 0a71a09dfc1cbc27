#include "invlens/common/types.h"

namespace invlens {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOK: return "OK";
        case ErrorCode::kNotFound: return "NotFound";
        case ErrorCode::kIOError: return "IOError";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kUnsupported: return "Unsupported";
        case ErrorCode::kManifestNotFound: return "ManifestNotFound";
        case ErrorCode::kManifestCorrupt: return "ManifestCorrupt";
        case ErrorCode::kSourceUnavailable: return "SourceUnavailable";
        case ErrorCode::kRecordFormatError: return "RecordFormatError";
        case ErrorCode::kRecordStreamCorrupt: return "RecordStreamCorrupt";
        case ErrorCode::kQueryCancelled: return "QueryCancelled";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (OK()) {
        return "OK";
    }
    std::string s = ErrorCodeName(code_);
    if (!msg_.empty()) {
        s += ": ";
        s += msg_;
    }
    return s;
}

} // namespace invlens
