#include "string.hpp"

namespace IDLX::Utils {

// Char Utilities
std::uint8_t ToLowerAscii(std::uint8_t c)
{
    return (c >= 'A' && c <= 'Z') ? (c | 0x20) : c;
}

bool IsLabelNameChar(char c)
{
    return (c >= 'a' && c <= 'z')
        || (c >= 'A' && c <= 'Z')
        || (c >= '0' && c <= '9')
        || c == '_';
}

bool IsLabelName(std::string_view str)
{
    if(str.empty())
        return false;

    for(char c : str)
        if(!IsLabelNameChar(c))
            return false;

    return true;
}

// String Utilties
bool CaseInsensitiveCompare(std::string_view lhs, std::string_view rhs)
{
    if(lhs.size() != rhs.size())
        return false;

    for(std::size_t i = 0; i < lhs.size(); ++i)
        if(ToLowerAscii(lhs[i]) != ToLowerAscii(rhs[i]))
            return false;

    return true;
}

std::vector<std::string_view> SplitOn(std::string_view str, char delim)
{
    std::vector<std::string_view> pieces;
    std::size_t start = 0;

    while(true) {
        std::size_t pos = str.find(delim, start);
        if(pos == std::string_view::npos) {
            pieces.push_back(str.substr(start));
            break;
        }

        pieces.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return pieces;
}

// Hash/Equal pair
std::size_t CaseInsensitiveHash::operator()(std::string_view key) const
{
    constexpr std::size_t fnvPrime       = 1099511628211ULL;
    constexpr std::size_t fnvOffsetBasis = 14695981039346656037ULL;

    std::size_t hash = fnvOffsetBasis;
    for(char c : key) {
        hash ^= ToLowerAscii(static_cast<std::uint8_t>(c));
        hash *= fnvPrime;
    }

    return hash;
}

bool CaseInsensitiveEqual::operator()(std::string_view lhs, std::string_view rhs) const
{
    return CaseInsensitiveCompare(lhs, rhs);
}

} // namespace IDLX::Utils
