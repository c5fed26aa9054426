#pragma once

#include "models.hpp"
#include "youtube_client.hpp"

#include <functional>
#include <string>
#include <vector>

namespace playlist_sync {

/// Drives cursor-based pagination through the throttled YouTubeClient.
/// A failed page aborts the whole fetch; partial results are discarded.
class Paginator {
public:
    /// Called after every page with everything accumulated so far and the
    /// server-reported total.
    using ProgressCallback =
        std::function<void(const std::vector<PlaylistItem>& items, int total)>;

    struct Stats {
        int totalFetched  = 0;
        int totalRequests = 0;
    };

    explicit Paginator(YouTubeClient& client, bool verbose = false);

    /// Fetch every item of @p playlistId in server order.
    /// @throws whatever the failing page threw (QuotaExceededError included).
    std::vector<PlaylistItem>
    fetchAllPlaylistItems(const std::string& playlistId,
                          const ProgressCallback& onProgress = nullptr);

    /// Fetch every playlist of the authenticated user.
    std::vector<Playlist> fetchAllPlaylists();

    Stats getStats() const { return mStats; }

private:
    YouTubeClient& mClient;
    bool           mVerbose;
    Stats          mStats{};

    template <typename T, typename FetchPage, typename OnPage>
    std::vector<T> drain(const char* what, FetchPage fetchPage, OnPage onPage);
};

} // namespace playlist_sync
