#pragma once

#include <string>
#include <utility>
#include <vector>

namespace playlist_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "8080", etc.
    std::string target;   // path prefix (e.g. "/youtube/v3")
};

/// Ordered list of query parameters; empty values are still emitted.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode a query component (RFC 3986 unreserved set kept as-is).
std::string urlEncode(const std::string& value);

/// Join @p path and @p params into "path?k=v&k2=v2".
std::string buildTarget(const std::string& path, const QueryParams& params);

/// Case-insensitive substring search (ASCII only).
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

} // namespace playlist_sync
