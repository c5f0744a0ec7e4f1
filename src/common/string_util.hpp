#pragma once

#include <string>
#include <string_view>

namespace hllrcon::util {

inline std::string trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(whitespace);
    return std::string(s.substr(first, last - first + 1));
}

} // namespace hllrcon::util
