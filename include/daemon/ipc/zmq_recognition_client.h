#pragma once

#include "daemon/ipc/zmq_request_client.h"
#include "detection/recognition_service.h"

#include <optional>
#include <string>

namespace needledrop {
namespace ipc {

/**
 * @brief RecognitionService backed by a fingerprinting sidecar.
 *
 * Request:  {"cmd":"IDENTIFY","params":{"wav_base64":"...","sample_rate":48000}}
 * Reply:    {"status":"ok","data":{"artist":..,"title":..,"confidence":..}}
 *           or {"status":"ok","data":null} when nothing matched.
 */
class ZmqRecognitionClient : public detection::RecognitionService {
   public:
    explicit ZmqRecognitionClient(std::string endpoint);

    std::optional<detection::RecognitionResult> identify(
        const audio::PcmBuffer& clip, const detection::CallOptions& options) override;

    // Decode the "data" field of an IDENTIFY reply; throws RecognitionError when malformed
    static std::optional<detection::RecognitionResult> parseIdentifyData(
        const nlohmann::json& data);

   private:
    ZmqRequestClient client_;
};

}  // namespace ipc
}  // namespace needledrop
