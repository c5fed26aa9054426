#include "export.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <string>

namespace playlist_sync {

namespace {

// "2024-03-05T10:00:00Z" -> "2024-03-05"; anything else is kept verbatim.
std::string dateOnly(const std::string& iso) {
    if (iso.size() >= 10 && iso[4] == '-' && iso[7] == '-') {
        return iso.substr(0, 10);
    }
    return iso;
}

// Cut at @p limit bytes without splitting a UTF-8 sequence.
std::string truncateDescription(const std::string& text) {
    if (text.size() <= kCsvDescriptionLimit) return text;

    std::size_t cut = kCsvDescriptionLimit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

const std::string& orElse(const std::string& value, const std::string& fallback) {
    return value.empty() ? fallback : value;
}

} // namespace

std::string escapeCsv(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) return value;

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

std::string sanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        out.push_back(std::isalnum(c) ? static_cast<char>(std::tolower(c)) : '_');
    }
    return out;
}

void exportCsv(const std::vector<PlaylistItem>& items, std::ostream& out) {
    out << "Position,Video ID,Title,Channel,Published,Description\n";
    for (const auto& item : items) {
        out << item.position << ','
            << escapeCsv(item.videoId) << ','
            << escapeCsv(item.title) << ','
            << escapeCsv(item.videoOwnerChannelTitle) << ','
            << escapeCsv(dateOnly(item.videoPublishedAt)) << ','
            << escapeCsv(truncateDescription(item.description)) << '\n';
    }
}

nlohmann::json buildJsonExport(const std::vector<PlaylistItem>& items,
                               const std::optional<Playlist>& playlist,
                               const std::string& playlistName,
                               const std::string& exportedAt) {
    nlohmann::json metadata = {
        {"exportedAt",   exportedAt},
        {"playlistId",   playlist ? playlist->id : std::string()},
        {"playlistName", playlistName},
        {"itemCount",    items.size()},
    };
    if (playlist) {
        metadata["playlistDescription"] = playlist->description;
        metadata["channelTitle"]        = playlist->channelTitle;
    }

    nlohmann::json entries = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json thumbnails = nlohmann::json::object();
        if (!item.thumbnails.defaultUrl.empty()) thumbnails["default"] = item.thumbnails.defaultUrl;
        if (!item.thumbnails.mediumUrl.empty())  thumbnails["medium"]  = item.thumbnails.mediumUrl;
        if (!item.thumbnails.highUrl.empty())    thumbnails["high"]    = item.thumbnails.highUrl;

        // Deleted and private videos fall back to the playlist owner and
        // the date the item was added.
        entries.push_back({
            {"position",     item.position},
            {"videoId",      item.videoId},
            {"title",        item.title},
            {"description",  item.description},
            {"channelTitle", orElse(item.videoOwnerChannelTitle, item.channelTitle)},
            {"channelId",    orElse(item.videoOwnerChannelId, item.channelId)},
            {"publishedAt",  orElse(item.videoPublishedAt, item.publishedAt)},
            {"thumbnails",   thumbnails},
        });
    }

    return {{"metadata", metadata}, {"items", entries}};
}

void exportJson(const std::vector<PlaylistItem>& items,
                const std::optional<Playlist>& playlist,
                const std::string& playlistName,
                const std::string& exportedAt,
                std::ostream& out) {
    out << buildJsonExport(items, playlist, playlistName, exportedAt).dump(2)
        << "\n";
}

std::string defaultExportFilename(const std::string& playlistName,
                                  const std::string& extension,
                                  std::int64_t epochMillis) {
    return sanitizeFilename(playlistName) + "_" + std::to_string(epochMillis) +
           "." + extension;
}

std::string utcTimestamp() {
    const std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace playlist_sync
