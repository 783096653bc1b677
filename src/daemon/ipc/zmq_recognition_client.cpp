#include "daemon/ipc/zmq_recognition_client.h"

#include "core/base64.h"
#include "core/error_codes.h"
#include "core/errors.h"
#include "logging/logger.h"

namespace needledrop {
namespace ipc {

ZmqRecognitionClient::ZmqRecognitionClient(std::string endpoint) : client_(std::move(endpoint)) {}

std::optional<detection::RecognitionResult> ZmqRecognitionClient::identify(
    const audio::PcmBuffer& clip, const detection::CallOptions& options) {
    std::vector<uint8_t> wav = audio::encodeWav16(clip);

    nlohmann::json command;
    command["cmd"] = "IDENTIFY";
    command["params"]["wav_base64"] = base64::encode(wav);
    command["params"]["sample_rate"] = clip.sampleRate;

    RequestResult reply = client_.request(command, options.timeout, options.cancelRequested);
    switch (reply.outcome) {
    case RequestOutcome::Ok:
        return parseIdentifyData(reply.data);
    case RequestOutcome::Timeout:
        throw RecognitionError(reply.message, ErrorCode::RECOGNITION_TIMEOUT);
    case RequestOutcome::Cancelled:
        throw RecognitionError(reply.message, ErrorCode::RECOGNITION_CANCELLED);
    case RequestOutcome::Transport:
        throw RecognitionError(reply.message, ErrorCode::RECOGNITION_UNAVAILABLE);
    case RequestOutcome::BadReply:
        throw RecognitionError(reply.message, ErrorCode::RECOGNITION_BAD_RESPONSE);
    case RequestOutcome::ErrorReply:
        break;
    }
    // Sidecars may name a recognition code of ours; anything else is a plain failure
    ErrorCode code = stringToErrorCode(reply.errorCode);
    if (!isRecognitionError(code)) {
        code = ErrorCode::RECOGNITION_FAILED;
    }
    throw RecognitionError("Recognizer error " + reply.errorCode + ": " + reply.message, code);
}

std::optional<detection::RecognitionResult> ZmqRecognitionClient::parseIdentifyData(
    const nlohmann::json& data) {
    if (data.is_null()) {
        return std::nullopt;
    }
    if (!data.is_object()) {
        throw RecognitionError("IDENTIFY data is not an object",
                               ErrorCode::RECOGNITION_BAD_RESPONSE);
    }

    detection::RecognitionResult result;
    try {
        result.artist = data.value("artist", std::string());
        result.title = data.value("title", std::string());
        result.confidence = data.value("confidence", 0.0);
    } catch (const nlohmann::json::exception& e) {
        throw RecognitionError(std::string("IDENTIFY data has wrong types: ") + e.what(),
                               ErrorCode::RECOGNITION_BAD_RESPONSE);
    }

    if (!detection::isValidIdentification(result)) {
        LOG_TRACE("Recognizer returned placeholder '{}' / '{}'", result.artist, result.title);
        return std::nullopt;
    }
    return result;
}

}  // namespace ipc
}  // namespace needledrop
