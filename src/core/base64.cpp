#include "core/base64.h"

#include <array>

namespace needledrop {
namespace base64 {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr uint8_t kInvalid = 0xFF;

constexpr std::array<uint8_t, 256> buildReverseTable() {
    std::array<uint8_t, 256> table{};
    for (auto& entry : table) {
        entry = kInvalid;
    }
    for (uint8_t i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = i;
    }
    return table;
}

constexpr std::array<uint8_t, 256> kReverse = buildReverseTable();

}  // namespace

std::string encode(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(encodedSize(length));

    size_t i = 0;
    for (; i + 2 < length; i += 3) {
        uint32_t group = (static_cast<uint32_t>(data[i]) << 16) |
                         (static_cast<uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kAlphabet[group & 0x3F]);
    }

    size_t remaining = length - i;
    if (remaining == 1) {
        uint32_t group = static_cast<uint32_t>(data[i]) << 16;
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.append("==");
    } else if (remaining == 2) {
        uint32_t group =
            (static_cast<uint32_t>(data[i]) << 16) | (static_cast<uint32_t>(data[i + 1]) << 8);
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(encoded.size() / 4 * 3);

    for (size_t q = 0; q < encoded.size(); q += 4) {
        bool lastQuantum = (q + 4 == encoded.size());
        uint32_t group = 0;
        int padding = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = encoded[q + k];
            if (c == '=') {
                // Padding only in the final two positions of the last quantum
                if (!lastQuantum || k < 2) {
                    return std::nullopt;
                }
                ++padding;
                group <<= 6;
                continue;
            }
            if (padding > 0) {
                return std::nullopt;
            }
            uint8_t value = kReverse[static_cast<uint8_t>(c)];
            if (value == kInvalid) {
                return std::nullopt;
            }
            group = (group << 6) | value;
        }

        out.push_back(static_cast<uint8_t>((group >> 16) & 0xFF));
        if (padding < 2) {
            out.push_back(static_cast<uint8_t>((group >> 8) & 0xFF));
        }
        if (padding < 1) {
            out.push_back(static_cast<uint8_t>(group & 0xFF));
        }
    }
    return out;
}

}  // namespace base64
}  // namespace needledrop
