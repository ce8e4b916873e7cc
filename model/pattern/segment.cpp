#include "segment.hpp"

#include "utils/string/string.hpp"

namespace IDLX::Model {

using namespace IDLX::Utils; // For 'IsLabelName'

const char* SegmentKindToString(SegmentKind kind)
{
    switch(kind) {
        case SegmentKind::LITERAL:      return "literal";
        case SegmentKind::LABEL:        return "label";
        case SegmentKind::GREEDY_LABEL: return "greedy_label";
        default:                        return "unknown";
    }
}

Segment::Segment(std::string content, SegmentKind kind)
    : content_(std::move(content)), kind_(kind)
{
    switch(kind_) {
        case SegmentKind::GREEDY_LABEL:
            rendered_ = "{" + content_ + "+}";
            break;
        case SegmentKind::LABEL:
            rendered_ = "{" + content_ + "}";
            break;
        default:
            rendered_ = content_;
            break;
    }
}

PatternResult<Segment> Segment::Create(std::string content, SegmentKind kind, std::string_view source)
{
    std::string_view src = source.empty() ? std::string_view{content} : source;

    if(kind == SegmentKind::LITERAL) {
        if(content.empty())
            return MakePatternError(PatternErrorKind::EMPTY_SEGMENT, content, src);

        if(content.find_first_of("{}") != std::string::npos)
            return MakePatternError(PatternErrorKind::ILLEGAL_LITERAL_CHARACTER, content, src);
    }
    else if(content.empty())
        return MakePatternError(
            PatternErrorKind::EMPTY_SEGMENT, content, src,
            "Empty label declaration in pattern: " + std::string{src}
        );

    else if(content.find_first_of("{}") != std::string::npos)
        return MakePatternError(
            PatternErrorKind::INVALID_LABEL_NAME, content, src,
            "Labels must not contain other labels. Found `" + content + "` in pattern: " + std::string{src}
        );

    else if(!IsLabelName(content))
        return MakePatternError(PatternErrorKind::INVALID_LABEL_NAME, content, src);

    return Segment(std::move(content), kind);
}

PatternResult<Segment> Segment::Parse(std::string_view token, std::string_view source)
{
    std::size_t len = token.size();

    if(len >= 2 && token.front() == '{' && token.back() == '}') {
        // "{name+}" -> greedy, "{name}" -> plain label
        if(token[len - 2] == '+')
            return Create(std::string{token.substr(1, len - 3)}, SegmentKind::GREEDY_LABEL, source);

        return Create(std::string{token.substr(1, len - 2)}, SegmentKind::LABEL, source);
    }

    return Create(std::string{token}, SegmentKind::LITERAL, source);
}

// vvv Type Checks vvv
bool Segment::IsLiteral() const
{
    return kind_ == SegmentKind::LITERAL;
}

bool Segment::IsLabel() const
{
    return kind_ != SegmentKind::LITERAL;
}

bool Segment::IsGreedyLabel() const
{
    return kind_ == SegmentKind::GREEDY_LABEL;
}

// vvv Accessors vvv
SegmentKind Segment::GetKind() const
{
    return kind_;
}

const std::string& Segment::GetContent() const
{
    return content_;
}

const std::string& Segment::ToString() const
{
    return rendered_;
}

// vvv Comparisons vvv
bool Segment::operator==(const Segment& other) const
{
    return rendered_ == other.rendered_;
}

bool Segment::operator!=(const Segment& other) const
{
    return !(*this == other);
}

bool Segment::operator<(const Segment& other) const
{
    return rendered_ < other.rendered_;
}

} // namespace IDLX::Model
