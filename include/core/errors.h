#pragma once

#include "core/error_codes.h"

#include <stdexcept>
#include <string>

namespace needledrop {

// Base of every exception thrown by the session core and its adapters.
class Error : public std::runtime_error {
   public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

/**
 * @brief Audio source failure.
 *
 * StreamClosed is recovered by closing and reopening the device; the
 * current cycle is skipped.
 */
class DeviceError : public Error {
   public:
    enum class Kind { OpenFailed, StreamClosed, IoError };

    DeviceError(Kind kind, const std::string& message)
        : Error(codeFor(kind), message), kind_(kind) {}

    Kind kind() const {
        return kind_;
    }

   private:
    static ErrorCode codeFor(Kind kind) {
        switch (kind) {
        case Kind::OpenFailed:
            return ErrorCode::DEVICE_OPEN_FAILED;
        case Kind::StreamClosed:
            return ErrorCode::DEVICE_STREAM_CLOSED;
        case Kind::IoError:
            return ErrorCode::DEVICE_IO_ERROR;
        }
        return ErrorCode::DEVICE_IO_ERROR;
    }

    Kind kind_;
};

// Treated as "no match" for the sample that raised it.
class RecognitionError : public Error {
   public:
    explicit RecognitionError(const std::string& message,
                              ErrorCode code = ErrorCode::RECOGNITION_FAILED)
        : Error(code, message) {}
};

// Now-playing/scrobble failure; dedup state is left untouched.
class SinkError : public Error {
   public:
    explicit SinkError(const std::string& message,
                       ErrorCode code = ErrorCode::SINK_SCROBBLE_FAILED)
        : Error(code, message) {}
};

// Ends the session: running=false, audio source released, listeners notified.
class FatalSessionError : public Error {
   public:
    explicit FatalSessionError(const std::string& message,
                               ErrorCode code = ErrorCode::SESSION_FATAL)
        : Error(code, message) {}
};

}  // namespace needledrop
