#include "detection/track.h"

#include <algorithm>
#include <cctype>

namespace needledrop {
namespace detection {

namespace {

bool isSentinel(std::string_view value) {
    if (value.size() != kUnknownSentinel.size()) {
        return false;
    }
    return std::equal(value.begin(), value.end(), kUnknownSentinel.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

bool isBlank(std::string_view value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

}  // namespace

bool isValidIdentification(std::string_view artist, std::string_view title) {
    if (isBlank(artist) || isBlank(title)) {
        return false;
    }
    return !isSentinel(artist) && !isSentinel(title);
}

std::optional<std::string> findReleaseYear(std::string_view text) {
    constexpr size_t kYearDigits = 4;
    for (size_t i = 0; i + kYearDigits <= text.size(); ++i) {
        if (i > 0 && isWordChar(text[i - 1])) {
            continue;
        }
        if (i + kYearDigits < text.size() && isWordChar(text[i + kYearDigits])) {
            continue;
        }
        std::string_view candidate = text.substr(i, kYearDigits);
        bool digits = std::all_of(candidate.begin(), candidate.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
        if (digits && (candidate.starts_with("19") || candidate.starts_with("20"))) {
            return std::string(candidate);
        }
    }
    return std::nullopt;
}

}  // namespace detection
}  // namespace needledrop
