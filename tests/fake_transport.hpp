#pragma once

/// Scripted HttpTransport for tests: answers requests in the order they
/// were queued and remembers what was asked.

#include "errors.hpp"
#include "http_transport.hpp"

#include <deque>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace playlist_sync {
namespace test {

class FakeTransport : public HttpTransport {
public:
    using Reply = std::function<nlohmann::json()>;

    std::vector<std::string> targets;
    std::vector<std::string> tokens;

    void respond(nlohmann::json body) {
        mReplies.push_back([body = std::move(body)] { return body; });
    }

    template <typename Error>
    void fail(Error error) {
        mReplies.push_back([error]() -> nlohmann::json { throw error; });
    }

    nlohmann::json get(const std::string& target,
                       const std::string& bearerToken) override {
        targets.push_back(target);
        tokens.push_back(bearerToken);
        if (mReplies.empty()) {
            throw std::logic_error("unexpected request: " + target);
        }
        Reply reply = std::move(mReplies.front());
        mReplies.pop_front();
        return reply();
    }

    std::size_t pending() const { return mReplies.size(); }

private:
    std::deque<Reply> mReplies;
};

/// playlistItems.list page with @p count items numbered from @p first.
inline nlohmann::json itemsPage(int first, int count, int total,
                                const std::string& nextPageToken = "") {
    nlohmann::json items = nlohmann::json::array();
    for (int i = first; i < first + count; ++i) {
        items.push_back({
            {"id", "item-" + std::to_string(i)},
            {"snippet", {
                {"position", i},
                {"title", "Video " + std::to_string(i)},
                {"playlistId", "PL1"},
            }},
            {"contentDetails", {{"videoId", "vid" + std::to_string(i)}}},
        });
    }

    nlohmann::json page = {
        {"kind", "youtube#playlistItemListResponse"},
        {"pageInfo", {{"totalResults", total}, {"resultsPerPage", 50}}},
        {"items", items},
    };
    if (!nextPageToken.empty()) page["nextPageToken"] = nextPageToken;
    return page;
}

/// Provider-style 403 body carrying @p reason.
inline nlohmann::json reasonBody(const std::string& reason) {
    return {{"error", {{"errors", nlohmann::json::array({{{"reason", reason}}})}}}};
}

} // namespace test
} // namespace playlist_sync
