#include "youtube_client.hpp"

#include "mapping.hpp"
#include "quota_costs.hpp"

#include <exception>
#include <iostream>

namespace playlist_sync {

namespace {

const char* const kPlaylistParts = "snippet,contentDetails";

} // namespace

YouTubeClient::YouTubeClient(HttpTransport& transport,
                             ThrottleQueue& throttle,
                             TokenProvider tokenProvider)
    : mTransport(transport)
    , mThrottle(throttle)
    , mTokenProvider(std::move(tokenProvider)) {}

// ---------------------------------------------------------------------------
// Throttled request
// ---------------------------------------------------------------------------

nlohmann::json YouTubeClient::get(const std::string& path,
                                  const QueryParams& params)
{
    const int cost = costOf(path);
    const std::string target = buildTarget(path, params);

    if (mVerbose) {
        std::cerr << "[Client] " << target << " (cost " << cost << ")\n";
    }

    try {
        return mThrottle.execute(cost, [&] {
            const std::string token = mTokenProvider ? mTokenProvider() : "";
            return mTransport.get(target, token);
        });
    } catch (const HttpError& e) {
        reportAuthFailure(e);
        handleQuotaError(std::current_exception());
    } catch (const std::exception&) {
        handleQuotaError(std::current_exception());
    }
}

void YouTubeClient::reportAuthFailure(const HttpError& error) const {
    if (!isAuthFailure(error)) return;

    if (mVerbose) {
        std::cerr << "[Client] Credential rejected: " << error.what() << "\n";
    }
    if (mOnAuthFailure) {
        mOnAuthFailure(error);
    }
}

// ---------------------------------------------------------------------------
// Endpoints
// ---------------------------------------------------------------------------

PageResult<Playlist>
YouTubeClient::fetchPlaylistsPage(const std::optional<std::string>& pageToken)
{
    QueryParams params{
        {"part", kPlaylistParts},
        {"mine", "true"},
        {"maxResults", std::to_string(kMaxResults)},
    };
    if (pageToken) params.emplace_back("pageToken", *pageToken);

    return parsePlaylistsPage(get("/playlists", params));
}

PageResult<PlaylistItem>
YouTubeClient::fetchPlaylistItemsPage(const std::string& playlistId,
                                      const std::optional<std::string>& pageToken)
{
    QueryParams params{
        {"part", kPlaylistParts},
        {"playlistId", playlistId},
        {"maxResults", std::to_string(kMaxResults)},
    };
    if (pageToken) params.emplace_back("pageToken", *pageToken);

    return parsePlaylistItemsPage(get("/playlistItems", params));
}

std::optional<Playlist>
YouTubeClient::fetchPlaylistById(const std::string& playlistId)
{
    auto page = parsePlaylistsPage(get("/playlists", {
        {"part", kPlaylistParts},
        {"id", playlistId},
    }));

    if (page.items.empty()) return std::nullopt;
    return page.items.front();
}

bool YouTubeClient::hasChannel()
{
    try {
        const auto body = get("/channels", {{"part", "snippet"}, {"mine", "true"}});
        auto items = body.find("items");
        return items != body.end() && items->is_array() && !items->empty();
    } catch (const QuotaExceededError&) {
        throw;
    } catch (const std::exception& e) {
        if (mVerbose) {
            std::cerr << "[Client] Channel lookup failed: " << e.what() << "\n";
        }
        return false;
    }
}

} // namespace playlist_sync
