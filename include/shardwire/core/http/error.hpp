#pragma once

#include <chrono>
#include <string_view>


namespace shardwire::core::http {

/*
===============================================================================
 http::Error
===============================================================================

Outcome of one dispatched request.

RateLimited is returned only when the caller opted out of waiting (or the
retry budget for 429 answers ran out); the accompanying Outcome carries how
long the caller would have been suspended. Waiting callers never see it.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Rate limiting -------------------------------------------------------
    RateLimited,      // Would block (wait == false) or 429 retries exhausted

    // --- Client errors -------------------------------------------------------
    BadRequest,       // 400
    Unauthorized,     // 401
    Forbidden,        // 403
    NotFound,         // 404
    UnexpectedStatus, // Any other non-2xx status

    // --- Server / transport --------------------------------------------------
    ServerError,      // 5xx
    TransportFailure, // The external HTTP client failed to perform the exchange
    InvalidBody       // 2xx with a body that does not match the expected schema
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:             return "None";
    case Error::RateLimited:      return "RateLimited";
    case Error::BadRequest:       return "BadRequest";
    case Error::Unauthorized:     return "Unauthorized";
    case Error::Forbidden:        return "Forbidden";
    case Error::NotFound:         return "NotFound";
    case Error::UnexpectedStatus: return "UnexpectedStatus";
    case Error::ServerError:      return "ServerError";
    case Error::TransportFailure: return "TransportFailure";
    case Error::InvalidBody:      return "InvalidBody";
    default:                      return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Error classify_status(int status) noexcept {
    if (status >= 200 && status < 300) return Error::None;
    switch (status) {
        case 400: return Error::BadRequest;
        case 401: return Error::Unauthorized;
        case 403: return Error::Forbidden;
        case 404: return Error::NotFound;
        case 429: return Error::RateLimited;
        default:  break;
    }
    return (status >= 500) ? Error::ServerError : Error::UnexpectedStatus;
}

struct Outcome {
    Error error{Error::None};
    std::chrono::milliseconds retry_after{0}; // meaningful with Error::RateLimited

    [[nodiscard]]
    inline bool ok() const noexcept {
        return error == Error::None;
    }
};

} // namespace shardwire::core::http
