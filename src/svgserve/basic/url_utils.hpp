#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace SvgServe
{

inline std::int32_t HexDigit(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch + 10 - 'a';
    if (ch >= 'A' && ch <= 'F') return ch + 10 - 'A';
    return -1;
}

// Percent-decode a uri path. '+' is kept as is, it only means space in form data.
// Returns std::nullopt when an escape sequence is truncated or not hexadecimal.
inline std::optional<std::string> UrlDecode(std::string_view EncodedString) {
    std::string Data;
    Data.reserve(EncodedString.size());

    for (std::size_t CharIdx = 0; CharIdx < EncodedString.size();) {
        if (EncodedString[CharIdx] != '%') {
            Data.push_back(EncodedString[CharIdx]);
            CharIdx++;
            continue;
        }
        if (CharIdx + 3 > EncodedString.size()) return std::nullopt;
        auto high = HexDigit(EncodedString[CharIdx + 1]);
        auto low  = HexDigit(EncodedString[CharIdx + 2]);
        if (high < 0 || low < 0) return std::nullopt;
        Data.push_back(static_cast<char>((high << 4) | low));
        CharIdx += 3;
    }

    return Data;
}

inline std::string CorrectApiSlash(std::string_view api) {
    if (api.empty()) return "/";
    if (api[0] != '/') return std::string("/") + std::string(api);
    return std::string(api);
}
} // namespace SvgServe
