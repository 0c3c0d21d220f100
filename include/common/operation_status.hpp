#pragma once

#include <string>

enum class ErrorKind {
    None,
    ValidationError,    // missing or malformed arguments, nothing sent
    NoVdcSelected,      // VDC-scoped command without a selected VDC
    RemoteRejected,     // server answered with a non-2xx status
    AuthFailure,        // no usable session, or 401/403 from the server
    ConnectionFailure,  // transport error before any HTTP status
    UsageError          // unknown command path or malformed command line
};

struct OperationStatus {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    long httpCode = 0;

    bool ok() const { return kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    static OperationStatus success() { return OperationStatus(); }

    static OperationStatus failure(ErrorKind kind, const std::string& message, long httpCode = 0) {
        OperationStatus status;
        status.kind = kind;
        status.message = message;
        status.httpCode = httpCode;
        return status;
    }
};

inline std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::ValidationError:   return "ValidationError";
        case ErrorKind::NoVdcSelected:     return "NoVdcSelected";
        case ErrorKind::RemoteRejected:    return "RemoteRejected";
        case ErrorKind::AuthFailure:       return "AuthFailure";
        case ErrorKind::ConnectionFailure: return "ConnectionFailure";
        case ErrorKind::UsageError:        return "UsageError";
        default:                           return "Unknown";
    }
}
