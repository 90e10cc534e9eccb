#include "txnlens/CsvLoader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

#ifdef TXNLENS_USE_ZSTD
#include <zstd.h>
#endif

namespace txnlens {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parseAmount(std::string text, double& out) {
    text = trim(text);
    if (!text.empty() && text[0] == '$') text.erase(0, 1);
    if (text.empty()) return false;
    try {
        std::size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(v) || v < 0.0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

#ifdef TXNLENS_USE_ZSTD
bool decompressZstd(const std::string& in, std::string& out) {
    ZSTD_DStream* stream = ZSTD_createDStream();
    if (!stream) return false;
    ZSTD_initDStream(stream);

    std::string buffer(ZSTD_DStreamOutSize(), '\0');
    ZSTD_inBuffer input{in.data(), in.size(), 0};
    bool ok = true;
    while (input.pos < input.size) {
        ZSTD_outBuffer output{buffer.data(), buffer.size(), 0};
        size_t ret = ZSTD_decompressStream(stream, &output, &input);
        if (ZSTD_isError(ret)) {
            std::cerr << "CsvLoader: zstd error: " << ZSTD_getErrorName(ret) << "\n";
            ok = false;
            break;
        }
        out.append(buffer.data(), output.pos);
    }
    ZSTD_freeDStream(stream);
    return ok;
}
#endif

} // namespace

const std::vector<std::string>& CsvLoader::requiredColumns() {
    static const std::vector<std::string> columns = {
        "id", "date", "client_id", "card_id", "amount", "use_chip",
        "merchant_id", "merchant_city", "merchant_state", "zip", "mcc"
    };
    return columns;
}

CsvLoader::CsvLoader(std::size_t progressEvery, bool verbose)
    : progressEvery_(std::max<std::size_t>(1, progressEvery)), verbose_(verbose) {
}

bool CsvLoader::readRecord(std::istream& in, std::vector<std::string>& fields) {
    fields.clear();
    std::string field;
    bool inQuotes = false;
    bool sawAny = false;
    char ch;
    while (in.get(ch)) {
        sawAny = true;
        if (inQuotes) {
            if (ch == '"') {
                if (in.peek() == '"') {
                    in.get(ch);
                    field.push_back('"');
                } else {
                    inQuotes = false;
                }
            } else {
                field.push_back(ch);
            }
            continue;
        }
        if (ch == '"') {
            inQuotes = true;
        } else if (ch == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (ch == '\r') {
            if (in.peek() == '\n') in.get(ch);
            break;
        } else if (ch == '\n') {
            break;
        } else {
            field.push_back(ch);
        }
    }
    if (!sawAny) return false;
    fields.push_back(std::move(field));
    return true;
}

Result<Transaction> CsvLoader::parseRow(const std::vector<std::string>& header,
                                        const std::vector<std::string>& fields) {
    auto column = [&](const char* name) -> std::string {
        for (std::size_t i = 0; i < header.size() && i < fields.size(); ++i) {
            if (header[i] == name) return trim(fields[i]);
        }
        return {};
    };

    Transaction txn;
    txn.id = column("id");
    if (txn.id.empty()) {
        return makeError(ErrorCode::InvalidRecordData, "Transaction ID is empty");
    }

    const std::string dateText = column("date");
    if (dateText.empty()) {
        return makeError(ErrorCode::InvalidRecordData, "Date is empty");
    }
    auto date = parseTimestamp(dateText);
    if (!date) {
        return makeError(ErrorCode::InvalidRecordData, "bad date '" + dateText + "'");
    }
    txn.date = *date;

    const std::string amountText = column("amount");
    if (!parseAmount(amountText, txn.amount)) {
        return makeError(ErrorCode::InvalidRecordData, "bad amount '" + amountText + "'");
    }

    txn.clientId = column("client_id");
    txn.cardId = column("card_id");
    txn.useChip = column("use_chip");
    txn.merchantId = column("merchant_id");
    txn.merchantCity = column("merchant_city");
    txn.merchantState = column("merchant_state");
    txn.zip = column("zip");
    txn.mcc = column("mcc");
    txn.errors = column("errors");
    return txn;
}

Result<LoadReport> CsvLoader::load(const std::string& path, TransactionStore& store) const {
    std::cerr << "CsvLoader: loading transactions from " << path << "\n";
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "CsvLoader: cannot open " << path << "\n";
        return makeError(ErrorCode::DataLoadError, "cannot open CSV source " + path);
    }

    if (endsWith(path, ".zst")) {
#ifdef TXNLENS_USE_ZSTD
        std::string compressed((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        std::string raw;
        if (!decompressZstd(compressed, raw)) {
            return makeError(ErrorCode::DataLoadError, "failed to decompress " + path);
        }
        std::istringstream in(raw);
        return load(in, store);
#else
        return makeError(ErrorCode::DataLoadError, "zstd support not compiled in; cannot read " + path);
#endif
    }
    return load(file, store);
}

Result<LoadReport> CsvLoader::load(std::istream& in, TransactionStore& store) const {
    std::vector<std::string> header;
    if (!readRecord(in, header) || (header.size() == 1 && trim(header[0]).empty())) {
        std::cerr << "CsvLoader: source has no header row\n";
        return makeError(ErrorCode::DataLoadError, "CSV source has no header row");
    }
    for (auto& name : header) name = trim(name);
    // tolerate a UTF-8 byte order mark on the first column
    if (header[0].size() >= 3 && header[0].compare(0, 3, "\xEF\xBB\xBF") == 0) header[0].erase(0, 3);

    // absent columns read as empty; a missing date or amount fails each row instead
    for (const auto& expected : requiredColumns()) {
        if (std::find(header.begin(), header.end(), expected) == header.end()) {
            std::cerr << "CsvLoader: header has no column " << expected << "; values default to empty\n";
        }
    }
    const std::size_t idColumn = static_cast<std::size_t>(
        std::find(header.begin(), header.end(), "id") - header.begin());

    LoadReport report;
    auto bulk = store.beginBulkLoad();
    std::vector<std::string> fields;
    std::size_t rowNum = 1;
    while (readRecord(in, fields)) {
        ++rowNum;
        if (idColumn >= fields.size() || trim(fields[idColumn]).empty()) {
            ++report.skipped;
            continue;
        }
        auto parsed = parseRow(header, fields);
        if (!parsed) {
            ++report.errors;
            std::cerr << "CsvLoader: error loading transaction at row " << rowNum << ": "
                      << parsed.error().message << "\n";
            continue;
        }
        bulk.add(std::move(parsed).value());
        ++report.loaded;
        if (report.loaded % progressEvery_ == 0) {
            std::cerr << "CsvLoader: loaded " << report.loaded << " transactions\n";
        } else if (verbose_) {
            std::cerr << "CsvLoader: row " << rowNum << " ok\n";
        }
    }
    if (in.bad()) {
        std::cerr << "CsvLoader: read failure after row " << rowNum << "\n";
        return makeError(ErrorCode::DataLoadError, "read failure while loading CSV");
    }

    bulk.commit();
    std::cerr << "CsvLoader: loaded=" << report.loaded << " skipped=" << report.skipped
              << " errors=" << report.errors << "\n";
    return report;
}

} // namespace txnlens
