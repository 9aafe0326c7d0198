#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace SvgServe
{

inline void StringToLower(std::string& input) {
    std::transform(input.begin(), input.end(), input.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
}

inline bool StringEqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

inline bool StringIsDigits(std::string_view input) {
    return !input.empty() &&
           std::all_of(input.begin(), input.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace SvgServe
