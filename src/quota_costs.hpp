#pragma once

#include <string>
#include <utility>
#include <vector>

namespace playlist_sync {

/// Published per-call point costs of the YouTube Data API v3 read
/// endpoints used by this client.
/// @see https://developers.google.com/youtube/v3/determine_quota_cost
namespace quota_costs {

constexpr int kPlaylistsList     = 1;
constexpr int kPlaylistItemsList = 1;
constexpr int kChannelsList      = 1;
constexpr int kSearchList        = 100;

/// Charged for paths that match no known endpoint. Never 0.
constexpr int kDefault = 1;

} // namespace quota_costs

/// Immutable endpoint -> cost mapping. An endpoint path matches every
/// resource name it contains; the longest (most specific) one wins, so
/// "/playlistItems" is never charged as "/playlists".
class QuotaCostTable {
public:
    using Entry = std::pair<std::string, int>;   // resource name, points

    /// @throws std::invalid_argument if a cost is negative or
    ///         @p defaultCost is not positive.
    QuotaCostTable(std::vector<Entry> entries, int defaultCost);

    /// Table of the YouTube Data API endpoints.
    static const QuotaCostTable& youtube();

    /// Cost of @p endpointPath; only the part before '?' is matched.
    int costOf(const std::string& endpointPath) const;

    int defaultCost() const { return mDefaultCost; }

private:
    std::vector<Entry> mEntries;   // sorted by descending name length
    int                mDefaultCost;
};

/// QuotaCostTable::youtube().costOf(endpointPath)
int costOf(const std::string& endpointPath);

} // namespace playlist_sync
