#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/errors.h - Engine error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//  Every failure raised by the engine is a bizgraph::Error carrying an
//  ErrorCode. "No path" is not an error: findPath returns an empty
//  optional instead.
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace bizgraph {

enum class ErrorCode {
    NotFound,          // referenced id absent from the store (write path)
    UnknownEntity,     // query references an id absent from the snapshot
    InvalidDepth,      // maxDepth outside [1, ceiling]
    InvalidArgument,   // malformed request, payload or config
    Conflict,          // one-edge-per-type-per-pair violated without overwrite
    Timeout,           // deadline exceeded; partial work discarded
    StoreUnavailable,  // transient store failure, safe to retry
    Storage            // non-transient store failure
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:         return "not_found";
        case ErrorCode::UnknownEntity:    return "unknown_entity";
        case ErrorCode::InvalidDepth:     return "invalid_depth";
        case ErrorCode::InvalidArgument:  return "invalid_argument";
        case ErrorCode::Conflict:         return "conflict";
        case ErrorCode::Timeout:          return "timeout";
        case ErrorCode::StoreUnavailable: return "store_unavailable";
        case ErrorCode::Storage:          return "storage";
    }
    return "unknown";
}

// Only transient store failures are retried internally.
inline bool isRetryable(ErrorCode code) {
    return code == ErrorCode::StoreUnavailable;
}

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }
    const char* codeName() const noexcept { return errorCodeName(code_); }
    bool retryable() const noexcept { return isRetryable(code_); }

    nlohmann::json toJson() const {
        return {{"code", codeName()}, {"message", what()}};
    }

private:
    ErrorCode code_;
};

// ── Convenience factories ──
inline Error notFound(const std::string& what) {
    return Error(ErrorCode::NotFound, what + " not found");
}

inline Error unknownEntity(const std::string& id) {
    return Error(ErrorCode::UnknownEntity, "Unknown business entity: " + id);
}

inline Error invalidDepth(int depth, int ceiling) {
    return Error(ErrorCode::InvalidDepth,
        "maxDepth " + std::to_string(depth) + " outside [1, " + std::to_string(ceiling) + "]");
}

inline Error invalidArgument(const std::string& message) {
    return Error(ErrorCode::InvalidArgument, message);
}

inline Error timeoutError(const std::string& operation) {
    return Error(ErrorCode::Timeout, "Deadline exceeded during " + operation);
}

} // namespace bizgraph
