#include "errors.hpp"

#include "util.hpp"

#include <utility>

namespace playlist_sync {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::QuotaExceeded:     return "quota-exceeded";
    case ErrorKind::AuthFailure:       return "auth-failure";
    case ErrorKind::UpstreamFailure:   return "upstream-failure";
    case ErrorKind::NetworkFailure:    return "network-failure";
    case ErrorKind::MalformedResponse: return "malformed-response";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// HttpError
// ---------------------------------------------------------------------------

HttpError::HttpError(unsigned int status, nlohmann::json body,
                     const std::string& target)
    : ApiError(status == 401 ? ErrorKind::AuthFailure : ErrorKind::UpstreamFailure,
               "HTTP " + std::to_string(status) + " from " + target)
    , mStatus(status)
    , mBody(std::move(body)) {}

std::optional<std::string> HttpError::firstReason() const {
    if (!mBody.is_object()) return std::nullopt;

    auto err = mBody.find("error");
    if (err == mBody.end() || !err->is_object()) return std::nullopt;

    auto errors = err->find("errors");
    if (errors == err->end() || !errors->is_array() || errors->empty()) {
        return std::nullopt;
    }

    const auto& first = errors->front();
    if (!first.is_object()) return std::nullopt;

    auto reason = first.find("reason");
    if (reason == first.end() || !reason->is_string()) return std::nullopt;
    return reason->get<std::string>();
}

void throwForStatus(unsigned int status, const nlohmann::json& body,
                    const std::string& target) {
    throw HttpError(status, body, target);
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

bool isQuotaExceeded(const std::exception& error) {
    if (dynamic_cast<const QuotaExceededError*>(&error) != nullptr) {
        return true;
    }

    if (const auto* http = dynamic_cast<const HttpError*>(&error)) {
        if (http->status() == 403) {
            const auto reason = http->firstReason();
            return reason && *reason == kQuotaExceededReason;
        }
    }

    return containsIgnoreCase(error.what(), "quota exceeded");
}

bool isQuotaExceeded(const std::exception_ptr& error) {
    if (!error) return false;
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return isQuotaExceeded(e);
    } catch (...) {
        // Not an exception type we can inspect.
        return false;
    }
}

bool isAuthFailure(const HttpError& error) {
    if (error.status() == 401) return true;
    return error.status() == 403 && !isQuotaExceeded(error);
}

void handleQuotaError(const std::exception_ptr& error) {
    if (!error) {
        throw std::invalid_argument("handleQuotaError called without an exception");
    }
    if (isQuotaExceeded(error)) {
        throw QuotaExceededError();
    }
    std::rethrow_exception(error);
}

} // namespace playlist_sync
