#include "mapping.hpp"

#include "errors.hpp"

#include <string>

namespace playlist_sync {

namespace {

const nlohmann::json& member(const nlohmann::json& node, const char* key) {
    static const nlohmann::json kNull;
    if (!node.is_object()) return kNull;
    auto it = node.find(key);
    return it == node.end() ? kNull : *it;
}

std::string str(const nlohmann::json& node, const char* key) {
    const auto& v = member(node, key);
    return v.is_string() ? v.get<std::string>() : std::string();
}

int integer(const nlohmann::json& node, const char* key) {
    const auto& v = member(node, key);
    return v.is_number_integer() ? v.get<int>() : 0;
}

template <typename T, typename ParseItem>
PageResult<T> parsePage(const nlohmann::json& body, const char* what,
                        ParseItem parseItem) {
    if (!body.is_object()) {
        throw MalformedResponseError(std::string(what) +
                                     " response is not a JSON object");
    }
    const auto& items = member(body, "items");
    if (!items.is_array()) {
        throw MalformedResponseError(std::string(what) +
                                     " response missing 'items' array");
    }

    PageResult<T> page;
    page.items.reserve(items.size());
    for (const auto& node : items) {
        page.items.push_back(parseItem(node));
    }

    const auto& token = member(body, "nextPageToken");
    if (token.is_string() && !token.get<std::string>().empty()) {
        page.nextPageToken = token.get<std::string>();
    }

    page.totalResults = integer(member(body, "pageInfo"), "totalResults");
    return page;
}

} // namespace

Playlist parsePlaylist(const nlohmann::json& node) {
    const auto& snippet = member(node, "snippet");

    Playlist p;
    p.id           = str(node, "id");
    p.title        = str(snippet, "title");
    p.description  = str(snippet, "description");
    p.channelTitle = str(snippet, "channelTitle");
    p.publishedAt  = str(snippet, "publishedAt");
    p.itemCount    = integer(member(node, "contentDetails"), "itemCount");
    return p;
}

PlaylistItem parsePlaylistItem(const nlohmann::json& node) {
    const auto& snippet = member(node, "snippet");
    const auto& details = member(node, "contentDetails");

    PlaylistItem item;
    item.id           = str(node, "id");
    item.playlistId   = str(snippet, "playlistId");
    item.position     = integer(snippet, "position");
    item.videoId      = str(details, "videoId");
    item.title        = str(snippet, "title");
    item.description  = str(snippet, "description");
    item.channelTitle = str(snippet, "channelTitle");
    item.channelId    = str(snippet, "channelId");
    item.publishedAt  = str(snippet, "publishedAt");

    item.videoOwnerChannelTitle = str(snippet, "videoOwnerChannelTitle");
    item.videoOwnerChannelId    = str(snippet, "videoOwnerChannelId");
    item.videoPublishedAt       = str(details, "videoPublishedAt");

    const auto& thumbs = member(snippet, "thumbnails");
    item.thumbnails.defaultUrl = str(member(thumbs, "default"), "url");
    item.thumbnails.mediumUrl  = str(member(thumbs, "medium"), "url");
    item.thumbnails.highUrl    = str(member(thumbs, "high"), "url");

    // Fall back to resourceId when contentDetails was not requested.
    if (item.videoId.empty()) {
        item.videoId = str(member(snippet, "resourceId"), "videoId");
    }
    return item;
}

PageResult<Playlist> parsePlaylistsPage(const nlohmann::json& responseBody) {
    return parsePage<Playlist>(responseBody, "playlists", parsePlaylist);
}

PageResult<PlaylistItem>
parsePlaylistItemsPage(const nlohmann::json& responseBody) {
    return parsePage<PlaylistItem>(responseBody, "playlistItems",
                                   parsePlaylistItem);
}

} // namespace playlist_sync
