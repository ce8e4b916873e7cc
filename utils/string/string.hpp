#ifndef IDLX_UTILS_STRING_HPP
#define IDLX_UTILS_STRING_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace IDLX::Utils {

// Some ASCII utilities (locale independent on purpose)
std::uint8_t ToLowerAscii(std::uint8_t c);
bool         IsLabelNameChar(char c);
bool         IsLabelName(std::string_view str);

// Case insensitive comparision
bool CaseInsensitiveCompare(std::string_view lhs, std::string_view rhs);

// Splits on every 'delim', keeping empty pieces ("a//b" -> "a", "", "b")
std::vector<std::string_view> SplitOn(std::string_view str, char delim);

// For unordered containers keyed by label names
struct CaseInsensitiveHash {
    std::size_t operator()(std::string_view key) const;
};

struct CaseInsensitiveEqual {
    bool operator()(std::string_view lhs, std::string_view rhs) const;
};

} // namespace IDLX::Utils

#endif // IDLX_UTILS_STRING_HPP
