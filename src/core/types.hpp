#pragma once

#include <string>
#include <vector>
#include <functional>

// Error categories surfaced to callers of the commission workflow
enum class ErrorCode {
    None,
    Conflict,           // another mutating job is active
    Validation,         // bad host group, extra vars or node set
    Topology,           // worker requested without a commissioned master
    StatusTransition,   // asset not in the expected prior state
    Configuration,      // configuration engine failed
    Canceled,           // job canceled through its cancel token
    Internal,
};

const char* error_code_name(ErrorCode code);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorCode::Internal};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::None;

    static Result<void> Ok() {
        return {true, "", ErrorCode::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorCode::Internal};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Carry an error across Result types, e.g. Result<AssetStatus> -> Result<bool>
template <typename To, typename From>
Result<To> forward_error(const Result<From>& r) {
    return Result<To>::Err(r.code, r.error);
}

// Line sink for job and engine output
using StatusCallback = std::function<void(const std::string&)>;
