#pragma once

#include <string>
#include <utility>
#include <variant>

namespace txnlens {

enum class ErrorCode {
    NotFound,
    InvalidPagination,
    InvalidSearchFilters,
    DataLoadError,
    InvalidRecordData
};

struct Error {
    ErrorCode code;
    std::string message;
};

const char* errorCodeName(ErrorCode code);

// Value-or-error return used by services and the loader. The store itself
// reports absence through std::optional / bool and never produces an Error.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(Error error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const& { return std::get<T>(state_); }
    T& value() & { return std::get<T>(state_); }
    T&& value() && { return std::get<T>(std::move(state_)); }

    const Error& error() const { return std::get<Error>(state_); }

private:
    std::variant<T, Error> state_;
};

// Result for operations with nothing to return on success.
struct Done {};
using Status = Result<Done>;

inline Error makeError(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace txnlens
