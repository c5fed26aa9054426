#include "errors.hpp"
#include "export.hpp"
#include "http_transport.hpp"
#include "pagination.hpp"
#include "quota_tracker.hpp"
#include "throttle.hpp"
#include "youtube_client.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum ExitCode {
    kExitOk            = 0,
    kExitFailure       = 1,
    kExitQuotaExceeded = 2,
    kExitAuthFailure   = 3,
};

struct Config {
    std::string baseUrl       = "https://www.googleapis.com/youtube/v3";
    std::string token;
    std::string playlistId;
    bool        listPlaylists = false;
    std::string format        = "json";
    std::string output;
    int         timeoutMs     = 10000;
    bool        verbose       = false;
    playlist_sync::ThrottleConfig throttle;
};

void printUsage() {
    std::cout
        << "Usage: playlist_sync [options]\n\n"
        << "Options:\n"
        << "  --playlist ID        Export every item of playlist ID\n"
        << "  --list-playlists     List the authenticated user's playlists\n"
        << "  --format json|csv    Export format                (default: json)\n"
        << "  --output FILE        Write the export to FILE, or - for stdout\n"
        << "                       (default: <playlist name>_<epoch ms>.<format>)\n"
        << "  --token TOKEN        OAuth access token           "
           "(default: $PLAYLIST_SYNC_ACCESS_TOKEN)\n"
        << "  --base-url URL       API base URL                 "
           "(default: https://www.googleapis.com/youtube/v3)\n"
        << "  --threshold N        Quota points per minute before throttling (default: 30)\n"
        << "  --max-quota N        Quota points per minute at full backoff   (default: 90)\n"
        << "  --timeout-ms N       HTTP timeout in ms           (default: 10000)\n"
        << "  --verbose            Enable verbose diagnostics\n"
        << "  --help, -h           Show this message\n\n"
        << "Exit status: 0 ok, 1 error, 2 quota exhausted (retry later), "
           "3 authentication failed\n";
}

Config parseArgs(int argc, char* argv[]) {
    Config cfg;
    cfg.throttle = playlist_sync::ThrottleConfig::fromEnvironment();
    if (const char* token = std::getenv("PLAYLIST_SYNC_ACCESS_TOKEN")) {
        cfg.token = token;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--playlist" && i + 1 < argc) {
            cfg.playlistId = argv[++i];
        } else if (arg == "--list-playlists") {
            cfg.listPlaylists = true;
        } else if (arg == "--format" && i + 1 < argc) {
            cfg.format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            cfg.output = argv[++i];
        } else if (arg == "--token" && i + 1 < argc) {
            cfg.token = argv[++i];
        } else if (arg == "--base-url" && i + 1 < argc) {
            cfg.baseUrl = argv[++i];
        } else if (arg == "--threshold" && i + 1 < argc) {
            cfg.throttle.threshold = std::stoi(argv[++i]);
        } else if (arg == "--max-quota" && i + 1 < argc) {
            cfg.throttle.maxQuotaPerMinute = std::stoi(argv[++i]);
        } else if (arg == "--timeout-ms" && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(kExitOk);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(kExitFailure);
        }
    }

    if (cfg.format != "json" && cfg.format != "csv") {
        std::cerr << "Unsupported format: " << cfg.format << "\n";
        std::exit(kExitFailure);
    }
    if (cfg.playlistId.empty() && !cfg.listPlaylists) {
        std::cerr << "Nothing to do: pass --playlist ID or --list-playlists\n\n";
        printUsage();
        std::exit(kExitFailure);
    }
    return cfg;
}

void printPlaylists(const std::vector<playlist_sync::Playlist>& playlists) {
    std::cout << "\n--- Playlists (" << playlists.size() << ") ---\n";
    for (std::size_t i = 0; i < playlists.size(); ++i) {
        const auto& p = playlists[i];
        std::cout << std::setw(4) << (i + 1) << "  "
                  << std::left << std::setw(36) << p.id << "  "
                  << std::setw(40) << p.title << "  "
                  << std::right << std::setw(5) << p.itemCount << " items\n";
    }
}

void writeExport(const Config& cfg,
                 const std::vector<playlist_sync::PlaylistItem>& items,
                 const std::optional<playlist_sync::Playlist>& playlist) {
    const std::string name = playlist ? playlist->title : cfg.playlistId;

    std::string path = cfg.output;
    if (path.empty()) {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch());
        path = playlist_sync::defaultExportFilename(name, cfg.format, now.count());
    }

    const bool toStdout = path == "-";
    std::ofstream file;
    if (!toStdout) {
        file.open(path);
        if (!file) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
    }
    std::ostream& out = toStdout ? std::cout : file;

    if (cfg.format == "csv") {
        playlist_sync::exportCsv(items, out);
    } else {
        playlist_sync::exportJson(items, playlist, name,
                                  playlist_sync::utcTimestamp(), out);
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write export");
    }
    if (!toStdout) {
        std::cerr << "Exported " << items.size() << " items to " << path << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace playlist_sync;

    try {
        Config cfg = parseArgs(argc, argv);

        std::cerr
            << "=== playlist_sync ===\n"
            << "Base URL:   " << cfg.baseUrl << "\n"
            << "Threshold:  " << cfg.throttle.threshold << " points/min\n"
            << "Max quota:  " << cfg.throttle.maxQuotaPerMinute << " points/min\n"
            << "Timeout:    " << cfg.timeoutMs << " ms\n"
            << "=====================\n";

        BeastHttpTransport transport(cfg.baseUrl, cfg.timeoutMs);
        transport.setVerbose(cfg.verbose);

        QuotaTracker tracker;
        ThrottleQueue throttle(tracker, cfg.throttle);
        throttle.setVerbose(cfg.verbose);

        std::string token = cfg.token;
        YouTubeClient client(transport, throttle, [&token] { return token; });
        client.setVerbose(cfg.verbose);
        client.setAuthFailureHandler([&token](const HttpError& e) {
            std::cerr << "Session expired or credential rejected ("
                      << e.status() << "); obtain a new access token.\n";
            token.clear();
        });

        Paginator paginator(client, cfg.verbose);

        if (cfg.listPlaylists) {
            printPlaylists(paginator.fetchAllPlaylists());
        }

        if (!cfg.playlistId.empty()) {
            const auto playlist = client.fetchPlaylistById(cfg.playlistId);
            if (!playlist) {
                std::cerr << "Playlist not found: " << cfg.playlistId << "\n";
                return kExitFailure;
            }

            const auto items = paginator.fetchAllPlaylistItems(
                cfg.playlistId,
                [](const std::vector<PlaylistItem>& soFar, int total) {
                    std::cerr << "\rLoaded " << soFar.size() << " / " << total
                              << " items" << std::flush;
                });
            std::cerr << "\n";

            writeExport(cfg, items, playlist);
        }

        const auto stats = paginator.getStats();
        std::cerr
            << "\n=== Summary Report ===\n"
            << "Total fetched:       " << stats.totalFetched << "\n"
            << "Total requests:      " << stats.totalRequests << "\n"
            << "Quota admitted:      " << throttle.admittedCount() << " calls\n"
            << "Throttle wait (s):   " << std::fixed << std::setprecision(2)
                                       << throttle.totalWaitMs() / 1000.0 << "\n"
            << "======================\n";

        return kExitOk;

    } catch (const QuotaExceededError& e) {
        std::cerr << "\nQuota exhausted: " << e.what() << "\n";
        return kExitQuotaExceeded;
    } catch (const HttpError& e) {
        std::cerr << "\nAPI error (" << toString(e.kind()) << "): "
                  << e.what() << "\n";
        return isAuthFailure(e) ? kExitAuthFailure : kExitFailure;
    } catch (const ApiError& e) {
        std::cerr << "\nAPI error (" << toString(e.kind()) << "): "
                  << e.what() << "\n";
        return e.kind() == ErrorKind::AuthFailure ? kExitAuthFailure
                                                  : kExitFailure;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return kExitFailure;
    }
}
