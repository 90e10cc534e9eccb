#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>
#include "TransactionStore.hpp"
#include "txnlens/Error.hpp"

namespace txnlens {

struct LoadReport {
    std::size_t loaded = 0;
    std::size_t skipped = 0;   // rows without an id
    std::size_t errors = 0;    // rows that failed to parse
};

// Reads transaction CSV into a store through a single bulk-load scope.
// Bad rows are logged and counted; a missing source or header row is a
// DataLoadError and leaves the store untouched. Columns absent from the
// header read as empty strings.
class CsvLoader {
public:
    // Columns a complete source carries; missing ones are warned about.
    static const std::vector<std::string>& requiredColumns();

    explicit CsvLoader(std::size_t progressEvery = 10000, bool verbose = false);

    // Files ending in ".zst" are decompressed first (TXNLENS_USE_ZSTD builds).
    Result<LoadReport> load(const std::string& path, TransactionStore& store) const;
    Result<LoadReport> load(std::istream& in, TransactionStore& store) const;

    // Builds a record from one row; InvalidRecordData on a bad date or amount.
    static Result<Transaction> parseRow(const std::vector<std::string>& header,
                                        const std::vector<std::string>& fields);

    // One RFC 4180 record; quoted fields may span lines. False at end of input.
    static bool readRecord(std::istream& in, std::vector<std::string>& fields);

private:
    std::size_t progressEvery_;
    bool verbose_;
};

} // namespace txnlens
