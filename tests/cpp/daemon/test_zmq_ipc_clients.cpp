#include "core/base64.h"
#include "core/errors.h"
#include "daemon/ipc/zmq_recognition_client.h"
#include "daemon/ipc/zmq_request_client.h"
#include "daemon/ipc/zmq_scrobble_sink.h"

#include "../support/fake_sidecar.h"

#include <atomic>
#include <gtest/gtest.h>

using namespace needledrop;
using namespace needledrop::ipc;
using testing_support::FakeSidecar;
using testing_support::makeIpcEndpoint;

namespace {

FakeSidecar::Handler replyWith(const std::string& body) {
    return [body](const nlohmann::json&) { return std::optional<std::string>(body); };
}

audio::PcmBuffer shortClip() {
    audio::PcmBuffer clip;
    clip.sampleRate = 8000;
    clip.samples.assign(800, 0.25f);
    return clip;
}

}  // namespace

// ============================================================
// ZmqRequestClient
// ============================================================

TEST(ZmqRequestClient, OkReplyCarriesData) {
    FakeSidecar sidecar(makeIpcEndpoint("req_ok"),
                        replyWith(R"({"status":"ok","data":{"value":7}})"));
    ZmqRequestClient client(sidecar.endpoint());

    RequestResult result = client.request({{"cmd", "PING"}}, std::chrono::seconds(2));
    ASSERT_TRUE(result.ok()) << result.message;
    EXPECT_EQ(result.data["value"], 7);
    ASSERT_EQ(sidecar.requests().size(), 1u);
    EXPECT_EQ(sidecar.requests()[0]["cmd"], "PING");
}

TEST(ZmqRequestClient, ErrorReplyKeepsCodeAndMessage) {
    FakeSidecar sidecar(makeIpcEndpoint("req_err"),
                        replyWith(R"({"status":"error","error_code":"QUOTA","message":"slow down"})"));
    ZmqRequestClient client(sidecar.endpoint());

    RequestResult result = client.request({{"cmd", "X"}}, std::chrono::seconds(2));
    EXPECT_EQ(result.outcome, RequestOutcome::ErrorReply);
    EXPECT_EQ(result.errorCode, "QUOTA");
    EXPECT_EQ(result.message, "slow down");
}

TEST(ZmqRequestClient, UntypedErrorFieldsAreKeptAsText) {
    FakeSidecar sidecar(makeIpcEndpoint("req_err_untyped"),
                        replyWith(R"({"status":"error","error_code":5,"message":{"detail":"x"}})"));
    ZmqRequestClient client(sidecar.endpoint());

    RequestResult result = client.request({{"cmd", "X"}}, std::chrono::seconds(2));
    EXPECT_EQ(result.outcome, RequestOutcome::ErrorReply);
    EXPECT_EQ(result.errorCode, "5");
    EXPECT_EQ(result.message, R"({"detail":"x"})");
}

TEST(ZmqRequestClient, NonJsonReplyIsBadReply) {
    FakeSidecar sidecar(makeIpcEndpoint("req_bad"), replyWith("OK"));
    ZmqRequestClient client(sidecar.endpoint());
    EXPECT_EQ(client.request({{"cmd", "X"}}, std::chrono::seconds(2)).outcome,
              RequestOutcome::BadReply);
}

TEST(ZmqRequestClient, TimeoutWhenPeerNeverAnswers) {
    FakeSidecar sidecar(makeIpcEndpoint("req_timeout"),
                        [](const nlohmann::json&) { return std::optional<std::string>(); });
    ZmqRequestClient client(sidecar.endpoint());

    auto begin = std::chrono::steady_clock::now();
    RequestResult result = client.request({{"cmd", "X"}}, std::chrono::milliseconds(150));
    EXPECT_EQ(result.outcome, RequestOutcome::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(150));
    EXPECT_STREQ(requestOutcomeToString(result.outcome), "timeout");
}

TEST(ZmqRequestClient, CancellationIsObservedWhileWaiting) {
    FakeSidecar sidecar(makeIpcEndpoint("req_cancel"),
                        [](const nlohmann::json&) { return std::optional<std::string>(); });
    ZmqRequestClient client(sidecar.endpoint());

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel = true;
    });
    auto begin = std::chrono::steady_clock::now();
    RequestResult result = client.request({{"cmd", "X"}}, std::chrono::seconds(30),
                                          [&] { return cancel.load(); });
    canceller.join();
    EXPECT_EQ(result.outcome, RequestOutcome::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(2));
}

TEST(ZmqRequestClient, CancelledBeforeSendDoesNotTouchTheWire) {
    FakeSidecar sidecar(makeIpcEndpoint("req_precancel"), replyWith(R"({"status":"ok"})"));
    ZmqRequestClient client(sidecar.endpoint());
    RequestResult result =
        client.request({{"cmd", "X"}}, std::chrono::seconds(1), [] { return true; });
    EXPECT_EQ(result.outcome, RequestOutcome::Cancelled);
    EXPECT_TRUE(sidecar.requests().empty());
}

TEST(ZmqRequestClient, RecoversAfterTimeout) {
    std::atomic<int> seen{0};
    std::string endpoint = makeIpcEndpoint("req_recover");
    ZmqRequestClient client(endpoint);
    {
        FakeSidecar silent(endpoint, [&](const nlohmann::json&) {
            ++seen;
            return std::optional<std::string>();
        });
        EXPECT_EQ(client.request({{"cmd", "X"}}, std::chrono::milliseconds(100)).outcome,
                  RequestOutcome::Timeout);
    }
    FakeSidecar healthy(endpoint, replyWith(R"({"status":"ok"})"));
    EXPECT_TRUE(client.request({{"cmd", "X"}}, std::chrono::seconds(2)).ok());
    EXPECT_EQ(seen.load(), 1);
}

// ============================================================
// ZmqRecognitionClient
// ============================================================

TEST(ZmqRecognitionClient, ParseIdentifyData) {
    EXPECT_FALSE(ZmqRecognitionClient::parseIdentifyData(nullptr).has_value());

    auto hit = ZmqRecognitionClient::parseIdentifyData(
        {{"artist", "Can"}, {"title", "Vitamin C"}, {"confidence", 0.8}});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->artist, "Can");
    EXPECT_EQ(hit->title, "Vitamin C");
    EXPECT_DOUBLE_EQ(hit->confidence, 0.8);

    EXPECT_FALSE(ZmqRecognitionClient::parseIdentifyData({{"artist", "None"}, {"title", "X"}})
                     .has_value());
    EXPECT_FALSE(
        ZmqRecognitionClient::parseIdentifyData({{"artist", ""}, {"title", "X"}}).has_value());

    try {
        ZmqRecognitionClient::parseIdentifyData(nlohmann::json::array());
        FAIL() << "expected RecognitionError";
    } catch (const RecognitionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RECOGNITION_BAD_RESPONSE);
    }
    EXPECT_THROW(ZmqRecognitionClient::parseIdentifyData({{"artist", 5}, {"title", "X"}}),
                 RecognitionError);
}

TEST(ZmqRecognitionClient, SendsWavClipAndParsesMatch) {
    FakeSidecar sidecar(
        makeIpcEndpoint("recognizer"),
        replyWith(R"({"status":"ok","data":{"artist":"Neu!","title":"Hallogallo","confidence":0.9}})"));
    ZmqRecognitionClient recognizer(sidecar.endpoint());

    detection::CallOptions options;
    options.timeout = std::chrono::seconds(2);
    auto result = recognizer.identify(shortClip(), options);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->artist, "Neu!");

    auto requests = sidecar.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0]["cmd"], "IDENTIFY");
    EXPECT_EQ(requests[0]["params"]["sample_rate"], 8000);
    auto wav = base64::decode(requests[0]["params"]["wav_base64"].get<std::string>());
    ASSERT_TRUE(wav.has_value());
    ASSERT_GE(wav->size(), 44u);
    EXPECT_EQ(std::string(wav->begin(), wav->begin() + 4), "RIFF");
}

TEST(ZmqRecognitionClient, NullDataMeansNoMatch) {
    FakeSidecar sidecar(makeIpcEndpoint("recognizer_miss"),
                        replyWith(R"({"status":"ok","data":null})"));
    ZmqRecognitionClient recognizer(sidecar.endpoint());
    EXPECT_FALSE(recognizer.identify(shortClip(), detection::CallOptions{}).has_value());
}

TEST(ZmqRecognitionClient, FailuresMapToRecognitionErrors) {
    FakeSidecar failing(makeIpcEndpoint("recognizer_fail"),
                        replyWith(R"({"status":"error","error_code":"X","message":"no"})"));
    ZmqRecognitionClient recognizer(failing.endpoint());
    try {
        recognizer.identify(shortClip(), detection::CallOptions{});
        FAIL() << "expected RecognitionError";
    } catch (const RecognitionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RECOGNITION_FAILED);
    }

    FakeSidecar quota(makeIpcEndpoint("recognizer_quota"),
                      replyWith(R"({"status":"error","error_code":"RECOGNITION_UNAVAILABLE"})"));
    ZmqRecognitionClient limited(quota.endpoint());
    try {
        limited.identify(shortClip(), detection::CallOptions{});
        FAIL() << "expected RecognitionError";
    } catch (const RecognitionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RECOGNITION_UNAVAILABLE);
    }

    FakeSidecar untyped(makeIpcEndpoint("recognizer_untyped"),
                        replyWith(R"({"status":"error","error_code":5})"));
    ZmqRecognitionClient confused(untyped.endpoint());
    try {
        confused.identify(shortClip(), detection::CallOptions{});
        FAIL() << "expected RecognitionError";
    } catch (const RecognitionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RECOGNITION_FAILED);
    }

    FakeSidecar silent(makeIpcEndpoint("recognizer_slow"),
                       [](const nlohmann::json&) { return std::optional<std::string>(); });
    ZmqRecognitionClient slow(silent.endpoint());
    detection::CallOptions options;
    options.timeout = std::chrono::milliseconds(100);
    try {
        slow.identify(shortClip(), options);
        FAIL() << "expected RecognitionError";
    } catch (const RecognitionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RECOGNITION_TIMEOUT);
    }
}

// ============================================================
// ZmqScrobbleSink
// ============================================================

TEST(ZmqScrobbleSink, SendsCommands) {
    FakeSidecar sidecar(makeIpcEndpoint("scrobbler"), replyWith(R"({"status":"ok"})"));
    ZmqScrobbleSink sink(sidecar.endpoint(), std::chrono::seconds(2));

    std::string error;
    EXPECT_TRUE(sink.updateNowPlaying("Faust", "Jennifer", error)) << error;
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    EXPECT_TRUE(sink.scrobble("Faust", "Jennifer", when, error)) << error;
    EXPECT_TRUE(sink.clearNowPlaying(error)) << error;

    auto requests = sidecar.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0]["cmd"], "NOW_PLAYING");
    EXPECT_EQ(requests[0]["params"]["artist"], "Faust");
    EXPECT_EQ(requests[1]["cmd"], "SCROBBLE");
    EXPECT_EQ(requests[1]["params"]["timestamp"], 1700000000);
    EXPECT_EQ(requests[2]["cmd"], "CLEAR_NOW_PLAYING");
}

TEST(ZmqScrobbleSink, ErrorReplyIsReturnedNotThrown) {
    FakeSidecar sidecar(makeIpcEndpoint("scrobbler_err"),
                        replyWith(R"({"status":"error","message":"bad session key"})"));
    ZmqScrobbleSink sink(sidecar.endpoint(), std::chrono::seconds(2));
    std::string error;
    EXPECT_FALSE(sink.updateNowPlaying("A", "T", error));
    EXPECT_NE(error.find("bad session key"), std::string::npos);
}

TEST(ZmqScrobbleSink, UntypedErrorReplyIsReturnedNotThrown) {
    FakeSidecar sidecar(makeIpcEndpoint("scrobbler_untyped"),
                        replyWith(R"({"status":"error","error_code":5})"));
    ZmqScrobbleSink sink(sidecar.endpoint(), std::chrono::seconds(2));
    std::string error;
    bool accepted = true;
    EXPECT_NO_THROW(accepted = sink.updateNowPlaying("A", "T", error));
    EXPECT_FALSE(accepted);
    EXPECT_FALSE(error.empty());
}

TEST(ZmqScrobbleSink, LooksUpTrackInfo) {
    FakeSidecar sidecar(
        makeIpcEndpoint("scrobbler_info"),
        replyWith(R"({"status":"ok","data":{"album":{"title":"Future Days"},"year":"1973",
                     "duration_ms":"582000","tags":["krautrock","psychedelic"],
                     "listeners":"98000","playcount":1500000}})"));
    ZmqScrobbleSink sink(sidecar.endpoint(), std::chrono::seconds(2));

    std::string error;
    auto info = sink.lookupTrackInfo("Can", "Future Days", error);
    ASSERT_TRUE(info.has_value()) << error;
    EXPECT_EQ(info->album, "Future Days");
    EXPECT_EQ(info->year, "1973");
    EXPECT_EQ(info->durationSeconds, 582);
    EXPECT_EQ(info->tags, (std::vector<std::string>{"krautrock", "psychedelic"}));
    EXPECT_EQ(info->listeners, 98000);
    EXPECT_EQ(info->playcount, 1500000);

    auto requests = sidecar.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0]["cmd"], "TRACK_INFO");
    EXPECT_EQ(requests[0]["params"]["artist"], "Can");
    EXPECT_EQ(requests[0]["params"]["title"], "Future Days");
}

TEST(ZmqScrobbleSink, TrackInfoErrorIsReported) {
    FakeSidecar sidecar(makeIpcEndpoint("scrobbler_info_err"),
                        replyWith(R"({"status":"error","message":"track not found"})"));
    ZmqScrobbleSink sink(sidecar.endpoint(), std::chrono::seconds(2));
    std::string error;
    EXPECT_FALSE(sink.lookupTrackInfo("A", "T", error).has_value());
    EXPECT_NE(error.find("track not found"), std::string::npos);
}

TEST(ZmqScrobbleSink, ParseTrackInfoToleratesLooseFields) {
    EXPECT_FALSE(ZmqScrobbleSink::parseTrackInfo(nullptr).has_value());

    auto info = ZmqScrobbleSink::parseTrackInfo(
        {{"album", "Neu! 75"},
         {"wiki", "The third album by the duo, released in January 1975."},
         {"duration_ms", "n/a"},
         {"tags", nlohmann::json::array({{{"name", "krautrock"}}, {{"name", "motorik"}}, "rock",
                                         "electronic"})},
         {"listeners", true}});
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->album, "Neu! 75");
    EXPECT_EQ(info->year, "1975");
    EXPECT_FALSE(info->durationSeconds.has_value());
    EXPECT_EQ(info->tags, (std::vector<std::string>{"krautrock", "motorik", "rock"}));
    EXPECT_FALSE(info->listeners.has_value());
    EXPECT_FALSE(info->playcount.has_value());
}
