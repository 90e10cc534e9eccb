#include "txnlens/Error.hpp"

namespace txnlens {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::NotFound: return "NotFound";
    case ErrorCode::InvalidPagination: return "InvalidPagination";
    case ErrorCode::InvalidSearchFilters: return "InvalidSearchFilters";
    case ErrorCode::DataLoadError: return "DataLoadError";
    case ErrorCode::InvalidRecordData: return "InvalidRecordData";
    }
    return "Unknown";
}

} // namespace txnlens
