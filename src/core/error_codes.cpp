#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace needledrop {

static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    {ErrorCode::DEVICE_NOT_FOUND, "DEVICE_NOT_FOUND"},
    {ErrorCode::DEVICE_OPEN_FAILED, "DEVICE_OPEN_FAILED"},
    {ErrorCode::DEVICE_STREAM_CLOSED, "DEVICE_STREAM_CLOSED"},
    {ErrorCode::DEVICE_IO_ERROR, "DEVICE_IO_ERROR"},
    {ErrorCode::DEVICE_FORMAT_NOT_SUPPORTED, "DEVICE_FORMAT_NOT_SUPPORTED"},
    {ErrorCode::DEVICE_XRUN, "DEVICE_XRUN"},

    {ErrorCode::RECOGNITION_FAILED, "RECOGNITION_FAILED"},
    {ErrorCode::RECOGNITION_TIMEOUT, "RECOGNITION_TIMEOUT"},
    {ErrorCode::RECOGNITION_CANCELLED, "RECOGNITION_CANCELLED"},
    {ErrorCode::RECOGNITION_BAD_RESPONSE, "RECOGNITION_BAD_RESPONSE"},
    {ErrorCode::RECOGNITION_UNAVAILABLE, "RECOGNITION_UNAVAILABLE"},

    {ErrorCode::SINK_NOW_PLAYING_FAILED, "SINK_NOW_PLAYING_FAILED"},
    {ErrorCode::SINK_SCROBBLE_FAILED, "SINK_SCROBBLE_FAILED"},
    {ErrorCode::SINK_TIMEOUT, "SINK_TIMEOUT"},
    {ErrorCode::SINK_UNAVAILABLE, "SINK_UNAVAILABLE"},

    {ErrorCode::SESSION_ALREADY_RUNNING, "SESSION_ALREADY_RUNNING"},
    {ErrorCode::SESSION_NOT_RUNNING, "SESSION_NOT_RUNNING"},
    {ErrorCode::SESSION_FATAL, "SESSION_FATAL"},
    {ErrorCode::SESSION_REOPEN_EXHAUSTED, "SESSION_REOPEN_EXHAUSTED"},

    {ErrorCode::IPC_INVALID_COMMAND, "IPC_INVALID_COMMAND"},
    {ErrorCode::IPC_INVALID_PARAMS, "IPC_INVALID_PARAMS"},
    {ErrorCode::IPC_PROTOCOL_ERROR, "IPC_PROTOCOL_ERROR"},
    {ErrorCode::IPC_TIMEOUT, "IPC_TIMEOUT"},
    {ErrorCode::IPC_CONNECTION_FAILED, "IPC_CONNECTION_FAILED"},

    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_FILE_NOT_FOUND, "VALIDATION_FILE_NOT_FOUND"},

    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "INTERNAL_UNKNOWN";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    switch (static_cast<uint32_t>(code) & 0xF000) {
    case 0x1000:
        return "audio_device";
    case 0x2000:
        return "recognition";
    case 0x3000:
        return "scrobble";
    case 0x4000:
        return "session";
    case 0x5000:
        return "ipc";
    case 0x6000:
        return "validation";
    default:
        return "internal";
    }
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
        << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    for (const auto& [code, name] : kErrorCodeStrings) {
        if (str == name) {
            return code;
        }
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace needledrop
