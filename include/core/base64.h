#ifndef NEEDLEDROP_BASE64_H
#define NEEDLEDROP_BASE64_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// RFC 4648 Base64 for binary payloads carried in JSON (WAV clips to the recognizer)
namespace needledrop {
namespace base64 {

std::string encode(const uint8_t* data, size_t length);

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

// nullopt when the length is not a multiple of 4 or a character is outside the alphabet
std::optional<std::vector<uint8_t>> decode(std::string_view encoded);

inline size_t encodedSize(size_t inputLength) {
    return ((inputLength + 2) / 3) * 4;
}

}  // namespace base64
}  // namespace needledrop

#endif  // NEEDLEDROP_BASE64_H
