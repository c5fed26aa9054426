#pragma once

#include "models.hpp"

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace playlist_sync {

/// Longest description written to CSV before it is cut and "..." appended.
constexpr std::size_t kCsvDescriptionLimit = 500;

/// Quote a CSV field when it contains a comma, quote, CR or LF.
std::string escapeCsv(const std::string& value);

/// Lowercase, with every non-alphanumeric character replaced by '_'.
std::string sanitizeFilename(const std::string& name);

/// "<sanitized name>_<epochMillis>.<extension>", e.g. "road_trip_1700000000000.csv".
std::string defaultExportFilename(const std::string& playlistName,
                                  const std::string& extension,
                                  std::int64_t epochMillis);

/// Write @p items as CSV: Position, Video ID, Title, Channel,
/// Published (YYYY-MM-DD), Description. Channel and Published describe
/// the video and stay blank for deleted or private videos.
void exportCsv(const std::vector<PlaylistItem>& items, std::ostream& out);

/// Build the JSON export document ({metadata, items}). Item channel and
/// date fall back to the playlist's when the video has none.
nlohmann::json buildJsonExport(const std::vector<PlaylistItem>& items,
                               const std::optional<Playlist>& playlist,
                               const std::string& playlistName,
                               const std::string& exportedAt);

/// Write buildJsonExport(...) pretty-printed with 2-space indentation.
void exportJson(const std::vector<PlaylistItem>& items,
                const std::optional<Playlist>& playlist,
                const std::string& playlistName,
                const std::string& exportedAt,
                std::ostream& out);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utcTimestamp();

} // namespace playlist_sync
