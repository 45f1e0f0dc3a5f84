/// \file detail/string_utils.h
/// \brief Internal string helpers shared across core modules.

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace LabelSheet::detail {

inline bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

/// Strips leading and trailing ASCII whitespace.
inline std::string_view TrimView(std::string_view s) {
    size_t begin = 0;
    size_t end   = s.size();
    while (begin < end && IsSpace(s[begin])) { ++begin; }
    while (end > begin && IsSpace(s[end - 1])) { --end; }
    return s.substr(begin, end - begin);
}

inline std::string Trim(std::string_view s) { return std::string(TrimView(s)); }

inline std::string ToLowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace LabelSheet::detail
