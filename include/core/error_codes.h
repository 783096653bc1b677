#ifndef NEEDLEDROP_ERROR_CODES_H
#define NEEDLEDROP_ERROR_CODES_H

#include <cstdint>
#include <string>

namespace needledrop {

/**
 * @brief Error codes shared by the session core and its adapters.
 *
 * Categories use the upper nibble of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Audio device
 * - 0x2xxx: Recognition service
 * - 0x3xxx: Scrobble sink
 * - 0x4xxx: Session lifecycle
 * - 0x5xxx: IPC/ZeroMQ control plane
 * - 0x6xxx: Validation
 * - 0xFxxx: Internal
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Audio device (0x1000)
    DEVICE_NOT_FOUND = 0x1001,
    DEVICE_OPEN_FAILED = 0x1002,
    DEVICE_STREAM_CLOSED = 0x1003,
    DEVICE_IO_ERROR = 0x1004,
    DEVICE_FORMAT_NOT_SUPPORTED = 0x1005,
    DEVICE_XRUN = 0x1006,

    // Recognition (0x2000)
    RECOGNITION_FAILED = 0x2001,
    RECOGNITION_TIMEOUT = 0x2002,
    RECOGNITION_CANCELLED = 0x2003,
    RECOGNITION_BAD_RESPONSE = 0x2004,
    RECOGNITION_UNAVAILABLE = 0x2005,

    // Scrobble sink (0x3000)
    SINK_NOW_PLAYING_FAILED = 0x3001,
    SINK_SCROBBLE_FAILED = 0x3002,
    SINK_TIMEOUT = 0x3003,
    SINK_UNAVAILABLE = 0x3004,

    // Session lifecycle (0x4000)
    SESSION_ALREADY_RUNNING = 0x4001,
    SESSION_NOT_RUNNING = 0x4002,
    SESSION_FATAL = 0x4003,
    SESSION_REOPEN_EXHAUSTED = 0x4004,

    // IPC (0x5000)
    IPC_INVALID_COMMAND = 0x5001,
    IPC_INVALID_PARAMS = 0x5002,
    IPC_PROTOCOL_ERROR = 0x5003,
    IPC_TIMEOUT = 0x5004,
    IPC_CONNECTION_FAILED = 0x5005,

    // Validation (0x6000)
    VALIDATION_INVALID_CONFIG = 0x6001,
    VALIDATION_FILE_NOT_FOUND = 0x6002,

    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to its enumerator name.
 * @return e.g. "DEVICE_STREAM_CLOSED", or "INTERNAL_UNKNOWN" for unmapped values
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Category name for an error code ("audio_device", "recognition", ...).
 */
const char* getErrorCategory(ErrorCode code);

// e.g. "0x1003"
std::string errorCodeToHex(ErrorCode code);

// Reverse of errorCodeToString; unknown names map to INTERNAL_UNKNOWN
ErrorCode stringToErrorCode(const std::string& str);

constexpr bool isRecognitionError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}

}  // namespace needledrop

#endif  // NEEDLEDROP_ERROR_CODES_H
