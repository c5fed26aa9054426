/// @file test_youtube_client.cpp
/// Unit tests for youtube_client.hpp — throttled calls and error surfacing.

#include "fake_transport.hpp"
#include "youtube_client.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace playlist_sync;
using playlist_sync::test::FakeTransport;
using playlist_sync::test::reasonBody;
using json = nlohmann::json;

class YouTubeClientTest : public ::testing::Test {
protected:
    std::int64_t  now = 1'700'000'000;
    QuotaTracker  tracker{[this] { return now; }};
    ThrottleQueue throttle{tracker, {}, [](std::chrono::milliseconds) {}};
    FakeTransport transport;
    std::string   token = "ya29.token";
    YouTubeClient client{transport, throttle, [this] { return token; }};

    int           authFailures = 0;
    unsigned int  lastAuthStatus = 0;

    void SetUp() override {
        client.setAuthFailureHandler([this](const HttpError& e) {
            ++authFailures;
            lastAuthStatus = e.status();
        });
    }
};

// ============================================================================
// get
// ============================================================================

TEST_F(YouTubeClientTest, GetBuildsTargetAndSendsBearerToken) {
    transport.respond({{"items", json::array()}});

    auto body = client.get("/playlists", {{"part", "snippet"}, {"mine", "true"}});

    EXPECT_TRUE(body.contains("items"));
    ASSERT_EQ(transport.targets.size(), 1u);
    EXPECT_EQ(transport.targets[0], "/playlists?part=snippet&mine=true");
    EXPECT_EQ(transport.tokens[0], "ya29.token");
}

TEST_F(YouTubeClientTest, TokenIsReadAtDispatchTime) {
    transport.respond(json::object());
    transport.respond(json::object());

    client.get("/channels");
    token = "refreshed";
    client.get("/channels");

    EXPECT_EQ(transport.tokens[1], "refreshed");
}

TEST_F(YouTubeClientTest, CostOfEndpointIsReserved) {
    transport.respond(json::object());
    transport.respond(json::object());

    client.get("/playlistItems", {{"playlistId", "PL1"}});
    client.get("/search", {{"q", "cats"}});

    EXPECT_EQ(tracker.countWindow(), 101);
}

TEST_F(YouTubeClientTest, QuotaReasonBecomesQuotaExceededError) {
    transport.fail(HttpError(403, reasonBody("quotaExceeded"), "/playlists"));

    EXPECT_THROW(client.get("/playlists"), QuotaExceededError);
    EXPECT_EQ(authFailures, 0);
}

TEST_F(YouTubeClientTest, QuotaMessageBecomesQuotaExceededError) {
    transport.fail(std::runtime_error("Daily Quota Exceeded"));
    EXPECT_THROW(client.get("/playlists"), QuotaExceededError);
}

TEST_F(YouTubeClientTest, UnauthorizedIsReportedAndRethrown) {
    transport.fail(HttpError(401, reasonBody("authError"), "/playlists"));

    try {
        client.get("/playlists");
        FAIL() << "expected HttpError";
    } catch (const HttpError& e) {
        EXPECT_EQ(e.status(), 401u);
        EXPECT_EQ(e.kind(), ErrorKind::AuthFailure);
    }
    EXPECT_EQ(authFailures, 1);
    EXPECT_EQ(lastAuthStatus, 401u);
}

TEST_F(YouTubeClientTest, ForbiddenIsReportedAndRethrown) {
    transport.fail(HttpError(403, reasonBody("forbidden"), "/playlists"));

    EXPECT_THROW(client.get("/playlists"), HttpError);
    EXPECT_EQ(authFailures, 1);
    EXPECT_EQ(lastAuthStatus, 403u);
}

TEST_F(YouTubeClientTest, ServerErrorIsNotAnAuthFailure) {
    transport.fail(HttpError(503, json(), "/playlists"));

    EXPECT_THROW(client.get("/playlists"), HttpError);
    EXPECT_EQ(authFailures, 0);
}

TEST_F(YouTubeClientTest, NetworkErrorPassesThrough) {
    transport.fail(NetworkError("timeout"));
    EXPECT_THROW(client.get("/playlists"), NetworkError);
}

TEST_F(YouTubeClientTest, FailedCallStillCountsAgainstQuota) {
    transport.fail(NetworkError("timeout"));
    EXPECT_THROW(client.get("/search"), NetworkError);
    EXPECT_EQ(tracker.countWindow(), 100);
}

// ============================================================================
// Endpoints
// ============================================================================

TEST_F(YouTubeClientTest, FetchPlaylistByIdFound) {
    transport.respond({{"items", json::array({
        {{"id", "PL9"}, {"snippet", {{"title", "Mix"}, {"channelTitle", "Me"}}}},
    })}});

    auto playlist = client.fetchPlaylistById("PL9");

    ASSERT_TRUE(playlist.has_value());
    EXPECT_EQ(playlist->title, "Mix");
    EXPECT_NE(transport.targets[0].find("id=PL9"), std::string::npos);
    EXPECT_EQ(transport.targets[0].find("mine="), std::string::npos);
}

TEST_F(YouTubeClientTest, FetchPlaylistByIdMissing) {
    transport.respond({{"items", json::array()}});
    EXPECT_FALSE(client.fetchPlaylistById("nope").has_value());
}

TEST_F(YouTubeClientTest, HasChannelTrueWhenItemsPresent) {
    transport.respond({{"items", json::array({{{"id", "UC1"}}})}});
    EXPECT_TRUE(client.hasChannel());
    EXPECT_NE(transport.targets[0].find("/channels?part=snippet&mine=true"),
              std::string::npos);
}

TEST_F(YouTubeClientTest, HasChannelFalseWhenNoItems) {
    transport.respond({{"items", json::array()}});
    EXPECT_FALSE(client.hasChannel());

    transport.respond(json::object());
    EXPECT_FALSE(client.hasChannel());
}

TEST_F(YouTubeClientTest, HasChannelFalseOnOtherFailures) {
    transport.fail(NetworkError("unreachable"));
    EXPECT_FALSE(client.hasChannel());

    transport.fail(HttpError(404, json(), "/channels"));
    EXPECT_FALSE(client.hasChannel());
}

TEST_F(YouTubeClientTest, HasChannelPropagatesQuotaExhaustion) {
    transport.fail(HttpError(403, reasonBody("quotaExceeded"), "/channels"));
    EXPECT_THROW(client.hasChannel(), QuotaExceededError);
}
