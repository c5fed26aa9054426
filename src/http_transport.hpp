#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace playlist_sync {

/// Read-only HTTP transport. This is the single place where raw transport
/// outcomes are mapped into the error taxonomy of errors.hpp.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// GET @p target (path + query, relative to the base URL) with an
    /// "Authorization: Bearer" header when @p bearerToken is non-empty.
    /// @return the parsed JSON body of a 2xx response.
    /// @throws HttpError on a non-2xx status, NetworkError on connection /
    ///         timeout / TLS failures, MalformedResponseError when a 2xx
    ///         body is not JSON.
    virtual nlohmann::json get(const std::string& target,
                               const std::string& bearerToken) = 0;
};

/// HttpTransport built on Boost.Beast (synchronous, one connection per call).
class BeastHttpTransport : public HttpTransport {
public:
    /// @param baseUrl    e.g. "https://www.googleapis.com/youtube/v3"
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit BeastHttpTransport(const std::string& baseUrl,
                                int timeoutMs = 10000);

    nlohmann::json get(const std::string& target,
                       const std::string& bearerToken) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    std::string mBasePath;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    struct RawResponse {
        unsigned int status = 0;
        std::string  body;
    };

    RawResponse doHttpRequest(const std::string& target,
                              const std::string& bearerToken);
    RawResponse doHttpsRequest(const std::string& target,
                               const std::string& bearerToken);
};

} // namespace playlist_sync
