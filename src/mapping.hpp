#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>

namespace playlist_sync {

/// Map a playlist resource JSON node into a Playlist struct.
/// Missing fields default to empty / 0.
Playlist parsePlaylist(const nlohmann::json& node);

/// Map a playlistItem resource JSON node into a PlaylistItem struct.
PlaylistItem parsePlaylistItem(const nlohmann::json& node);

/// Parse a playlists.list response body.
/// Throws MalformedResponseError if the body has no "items" array.
PageResult<Playlist> parsePlaylistsPage(const nlohmann::json& responseBody);

/// Parse a playlistItems.list response body.
/// Throws MalformedResponseError if the body has no "items" array.
PageResult<PlaylistItem> parsePlaylistItemsPage(const nlohmann::json& responseBody);

} // namespace playlist_sync
