#include "quota_costs.hpp"

#include <algorithm>
#include <stdexcept>

namespace playlist_sync {

QuotaCostTable::QuotaCostTable(std::vector<Entry> entries, int defaultCost)
    : mEntries(std::move(entries))
    , mDefaultCost(defaultCost)
{
    if (mDefaultCost <= 0) {
        throw std::invalid_argument("default quota cost must be > 0");
    }
    for (const auto& [resource, cost] : mEntries) {
        if (resource.empty() || cost < 0) {
            throw std::invalid_argument("invalid quota cost entry: '" +
                                        resource + "'");
        }
    }

    std::stable_sort(mEntries.begin(), mEntries.end(),
                     [](const Entry& a, const Entry& b) {
                         return a.first.size() > b.first.size();
                     });
}

const QuotaCostTable& QuotaCostTable::youtube() {
    static const QuotaCostTable table(
        {
            {"/playlists",     quota_costs::kPlaylistsList},
            {"/playlistItems", quota_costs::kPlaylistItemsList},
            {"/channels",      quota_costs::kChannelsList},
            {"/search",        quota_costs::kSearchList},
        },
        quota_costs::kDefault);
    return table;
}

int QuotaCostTable::costOf(const std::string& endpointPath) const {
    // Query values must not match a resource name.
    const std::string path = endpointPath.substr(0, endpointPath.find('?'));

    for (const auto& [resource, cost] : mEntries) {
        if (path.find(resource) != std::string::npos) {
            return cost;
        }
    }
    return mDefaultCost;
}

int costOf(const std::string& endpointPath) {
    return QuotaCostTable::youtube().costOf(endpointPath);
}

} // namespace playlist_sync
