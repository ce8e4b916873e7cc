#include "pattern_error.hpp"

namespace IDLX::Model {

const char* PatternErrorKindToString(PatternErrorKind kind)
{
    switch(kind) {
        case PatternErrorKind::EMPTY_SEGMENT:             return "EmptySegment";
        case PatternErrorKind::INVALID_LABEL_NAME:        return "InvalidLabelName";
        case PatternErrorKind::ILLEGAL_LITERAL_CHARACTER: return "IllegalLiteralCharacter";
        case PatternErrorKind::DUPLICATE_LABEL:           return "DuplicateLabel";
        case PatternErrorKind::GREEDY_LABEL_NOT_LAST:     return "GreedyLabelNotLast";
        case PatternErrorKind::MULTIPLE_GREEDY_LABELS:    return "MultipleGreedyLabels";
        case PatternErrorKind::GREEDY_LABEL_NOT_ALLOWED:  return "GreedyLabelNotAllowed";
        case PatternErrorKind::ADJACENT_LABELS:           return "AdjacentLabels";
        case PatternErrorKind::ILLEGAL_WILDCARD:          return "IllegalWildcard";
        case PatternErrorKind::MALFORMED_URI:             return "MalformedUri";
        case PatternErrorKind::INVALID_QUERY_LITERAL:     return "InvalidQueryLiteral";
        case PatternErrorKind::INVALID_TRAIT_VALUE:       return "InvalidTraitValue";
        default:                                          return "Unknown";
    }
}

PatternError MakePatternError(PatternErrorKind kind, std::string_view content, std::string_view source)
{
    std::string c{content};
    std::string s{source};
    std::string message;

    switch(kind) {
        case PatternErrorKind::EMPTY_SEGMENT:
            message = "Segments must not be empty. Found an empty segment in pattern: " + s;
            break;
        case PatternErrorKind::INVALID_LABEL_NAME:
            message = "Invalid label name in pattern: '" + c + "'. Labels must satisfy the "
                      "following regular expression: ^[a-zA-Z0-9_]+$";
            break;
        case PatternErrorKind::ILLEGAL_LITERAL_CHARACTER:
            message = "Literal segments must not contain `{` or `}` characters. Found segment `" + c + "`";
            break;
        case PatternErrorKind::DUPLICATE_LABEL:
            message = "Label `" + c + "` is defined more than once in pattern: " + s;
            break;
        case PatternErrorKind::GREEDY_LABEL_NOT_LAST:
            message = "A greedy label must be the last label in its pattern: " + s;
            break;
        case PatternErrorKind::MULTIPLE_GREEDY_LABELS:
            message = "At most one greedy label segment may exist in a pattern: " + s;
            break;
        case PatternErrorKind::GREEDY_LABEL_NOT_ALLOWED:
            message = "Pattern must not contain a greedy label. Found " + s;
            break;
        case PatternErrorKind::ADJACENT_LABELS:
            message = "Host labels must not be adjacent. Found `" + c + "` in pattern `" + s + "`";
            break;
        case PatternErrorKind::ILLEGAL_WILDCARD:
            message = "Wildcard levels are not allowed here. Found `" + c + "` in `" + s + "`";
            break;
        case PatternErrorKind::MALFORMED_URI:
            message = "Malformed URI pattern `" + s + "`";
            break;
        case PatternErrorKind::INVALID_QUERY_LITERAL:
            message = "Invalid query string literal `" + c + "` in URI pattern: " + s;
            break;
        case PatternErrorKind::INVALID_TRAIT_VALUE:
            message = "Invalid trait value `" + c + "`";
            break;
    }

    return PatternError{ kind, std::move(c), std::move(s), std::move(message) };
}

PatternError MakePatternError(
    PatternErrorKind kind, std::string_view content, std::string_view source, std::string message
)
{
    return PatternError{ kind, std::string{content}, std::string{source}, std::move(message) };
}

} // namespace IDLX::Model
