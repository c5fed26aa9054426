#pragma once

#include <exception>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace playlist_sync {

/// Failure categories surfaced by the API client.
enum class ErrorKind {
    QuotaExceeded,      // daily quota exhausted; retry later
    AuthFailure,        // expired or invalid credential (401)
    UpstreamFailure,    // any other non-2xx response
    NetworkFailure,     // resolve / connect / TLS / timeout
    MalformedResponse,  // body is not JSON or lacks the expected shape
};

const char* toString(ErrorKind kind);

/// Base of every failure raised by this library.
class ApiError : public std::runtime_error {
public:
    ApiError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), mKind(kind) {}

    ErrorKind kind() const { return mKind; }

private:
    ErrorKind mKind;
};

class QuotaExceededError : public ApiError {
public:
    explicit QuotaExceededError(
        const std::string& message =
            "YouTube API quota exceeded. Please try again tomorrow.")
        : ApiError(ErrorKind::QuotaExceeded, message) {}
};

/// Non-2xx response, carrying the provider's structured error body
/// ({"error": {"errors": [{"reason": ...}]}}) when there was one.
class HttpError : public ApiError {
public:
    HttpError(unsigned int status, nlohmann::json body, const std::string& target);

    unsigned int          status() const { return mStatus; }
    const nlohmann::json& body()   const { return mBody; }

    /// body.error.errors[0].reason, if present and a string.
    std::optional<std::string> firstReason() const;

private:
    unsigned int   mStatus;
    nlohmann::json mBody;
};

class NetworkError : public ApiError {
public:
    explicit NetworkError(const std::string& message)
        : ApiError(ErrorKind::NetworkFailure, message) {}
};

class MalformedResponseError : public ApiError {
public:
    explicit MalformedResponseError(const std::string& message)
        : ApiError(ErrorKind::MalformedResponse, message) {}
};

/// Reason code the provider reports when the daily quota is exhausted.
inline constexpr const char* kQuotaExceededReason = "quotaExceeded";

/// Map a raw non-2xx response into the error taxonomy.
/// @throws HttpError always.
[[noreturn]] void throwForStatus(unsigned int status,
                                 const nlohmann::json& body,
                                 const std::string& target);

/// Quota-exhaustion test, first matching rule wins:
///   1. QuotaExceededError                               -> true
///   2. HttpError 403: first reason == "quotaExceeded"   -> decided here
///   3. message contains "quota exceeded" (any case)     -> true
///   4. anything else                                    -> false
bool isQuotaExceeded(const std::exception& error);
bool isQuotaExceeded(const std::exception_ptr& error);

/// Credential rejected: any 401, or a 403 that is not quota exhaustion.
bool isAuthFailure(const HttpError& error);

/// Throw QuotaExceededError if @p error is a quota failure, otherwise
/// rethrow @p error unchanged.
[[noreturn]] void handleQuotaError(const std::exception_ptr& error);

} // namespace playlist_sync
