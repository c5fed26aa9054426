#include "pagination.hpp"

#include <iostream>
#include <iterator>
#include <optional>

namespace playlist_sync {

Paginator::Paginator(YouTubeClient& client, bool verbose)
    : mClient(client)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: paginated fetches
// ---------------------------------------------------------------------------

std::vector<PlaylistItem>
Paginator::fetchAllPlaylistItems(const std::string& playlistId,
                                 const ProgressCallback& onProgress)
{
    return drain<PlaylistItem>(
        "playlistItems",
        [&](const std::optional<std::string>& token) {
            return mClient.fetchPlaylistItemsPage(playlistId, token);
        },
        [&](const std::vector<PlaylistItem>& items, int total) {
            if (onProgress) onProgress(items, total);
        });
}

std::vector<Playlist> Paginator::fetchAllPlaylists()
{
    return drain<Playlist>(
        "playlists",
        [&](const std::optional<std::string>& token) {
            return mClient.fetchPlaylistsPage(token);
        },
        [](const std::vector<Playlist>&, int) {});
}

// ---------------------------------------------------------------------------
// Private: page loop
// ---------------------------------------------------------------------------

template <typename T, typename FetchPage, typename OnPage>
std::vector<T> Paginator::drain(const char* what, FetchPage fetchPage,
                                OnPage onPage)
{
    std::vector<T> accumulated;
    std::optional<std::string> cursor;

    do {
        if (mVerbose) {
            std::cerr << "[Paginator] Fetching " << what << " page";
            if (cursor) std::cerr << ", pageToken=" << *cursor;
            std::cerr << "\n";
        }

        PageResult<T> page;
        try {
            page = fetchPage(cursor);
        } catch (const std::exception& e) {
            if (mVerbose) {
                std::cerr << "[Paginator] Aborting " << what << " after "
                          << accumulated.size() << " items: " << e.what()
                          << "\n";
            }
            throw;
        }
        ++mStats.totalRequests;

        accumulated.insert(accumulated.end(),
                           std::make_move_iterator(page.items.begin()),
                           std::make_move_iterator(page.items.end()));
        mStats.totalFetched += static_cast<int>(page.items.size());

        if (mVerbose) {
            std::cerr << "[Paginator] Got " << page.items.size() << " "
                      << what << " (total so far: " << accumulated.size()
                      << " of " << page.totalResults << ")\n";
        }

        onPage(accumulated, page.totalResults);
        cursor = page.nextPageToken;
    } while (cursor);

    return accumulated;
}

} // namespace playlist_sync
