#pragma once

#include <optional>
#include <string>
#include <vector>

namespace playlist_sync {

/// Subset of a YouTube playlist resource used by the sync.
struct Playlist {
    std::string id;
    std::string title;
    std::string description;
    std::string channelTitle;
    std::string publishedAt;   // ISO-8601
    int         itemCount = 0;
};

/// Thumbnail URLs of a playlist item; empty when the size is missing.
struct Thumbnails {
    std::string defaultUrl;
    std::string mediumUrl;
    std::string highUrl;
};

/// Subset of a YouTube playlistItem resource.
struct PlaylistItem {
    std::string id;
    std::string playlistId;
    int         position = 0;
    std::string videoId;
    std::string title;
    std::string description;
    std::string channelTitle;            // owner of the playlist
    std::string channelId;
    std::string publishedAt;             // when the item was added
    // Empty for deleted and private videos.
    std::string videoOwnerChannelTitle;
    std::string videoOwnerChannelId;
    std::string videoPublishedAt;
    Thumbnails  thumbnails;
};

/// One page of a list endpoint.
template <typename T>
struct PageResult {
    std::vector<T>             items;
    std::optional<std::string> nextPageToken;
    int                        totalResults = 0;
};

} // namespace playlist_sync
