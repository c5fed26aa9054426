#pragma once

#include "errors.hpp"
#include "http_transport.hpp"
#include "models.hpp"
#include "throttle.hpp"
#include "util.hpp"

#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

namespace playlist_sync {

/// YouTube Data API v3 client. Every call is admitted by the ThrottleQueue
/// at the cost of its endpoint, and quota failures surface as
/// QuotaExceededError whatever shape the provider reported them in.
class YouTubeClient {
public:
    /// Supplies the current OAuth access token (may be empty).
    using TokenProvider      = std::function<std::string()>;
    /// Told about 401s and non-quota 403s so the credential can be dropped.
    using AuthFailureHandler = std::function<void(const HttpError&)>;

    static constexpr int kMaxResults = 50;

    YouTubeClient(HttpTransport& transport,
                  ThrottleQueue& throttle,
                  TokenProvider tokenProvider = {});

    /// Throttled GET of @p path (e.g. "/playlists") with @p params.
    /// @throws QuotaExceededError, or the transport's error unchanged.
    nlohmann::json get(const std::string& path, const QueryParams& params = {});

    /// playlists.list for the authenticated user.
    PageResult<Playlist>
    fetchPlaylistsPage(const std::optional<std::string>& pageToken = std::nullopt);

    /// playlistItems.list for @p playlistId.
    PageResult<PlaylistItem>
    fetchPlaylistItemsPage(const std::string& playlistId,
                           const std::optional<std::string>& pageToken = std::nullopt);

    /// Look up a single playlist; nullopt when the id is unknown.
    std::optional<Playlist> fetchPlaylistById(const std::string& playlistId);

    /// Whether the authenticated user owns a channel. Quota failures are
    /// rethrown; any other failure counts as "no channel".
    bool hasChannel();

    void setAuthFailureHandler(AuthFailureHandler handler) {
        mOnAuthFailure = std::move(handler);
    }
    void setVerbose(bool v) { mVerbose = v; }

private:
    HttpTransport&     mTransport;
    ThrottleQueue&     mThrottle;
    TokenProvider      mTokenProvider;
    AuthFailureHandler mOnAuthFailure;
    bool               mVerbose = false;

    void reportAuthFailure(const HttpError& error) const;
};

} // namespace playlist_sync
