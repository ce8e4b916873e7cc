#ifndef IDLX_MODEL_PATTERN_ERROR_HPP
#define IDLX_MODEL_PATTERN_ERROR_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace IDLX::Model {

enum class PatternErrorKind : std::uint8_t {
    EMPTY_SEGMENT,
    INVALID_LABEL_NAME,
    ILLEGAL_LITERAL_CHARACTER,
    DUPLICATE_LABEL,
    GREEDY_LABEL_NOT_LAST,
    MULTIPLE_GREEDY_LABELS,
    GREEDY_LABEL_NOT_ALLOWED,
    ADJACENT_LABELS,
    ILLEGAL_WILDCARD,
    MALFORMED_URI,
    INVALID_QUERY_LITERAL,
    INVALID_TRAIT_VALUE
};

// Everything a caller needs to report a rejected template, 'content' is the
// offending segment / level / label and 'source' the whole template text
struct PatternError {
    PatternErrorKind kind;
    std::string      content;
    std::string      source;
    std::string      message;
};

// Construction either yields a fully validated value or the first failure
template<typename T>
using PatternResult = std::variant<T, PatternError>;

const char*  PatternErrorKindToString(PatternErrorKind kind);
PatternError MakePatternError(PatternErrorKind kind, std::string_view content, std::string_view source);
PatternError MakePatternError(
    PatternErrorKind kind, std::string_view content, std::string_view source, std::string message
);

} // namespace IDLX::Model

#endif // IDLX_MODEL_PATTERN_ERROR_HPP
