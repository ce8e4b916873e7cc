#ifndef IDLX_MODEL_PATTERN_SEGMENT_HPP
#define IDLX_MODEL_PATTERN_SEGMENT_HPP

#include "pattern_error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace IDLX::Model {

enum class SegmentKind : std::uint8_t {
    LITERAL,
    LABEL,
    GREEDY_LABEL
};

const char* SegmentKindToString(SegmentKind kind);

// One token of a pattern: literal text, "{label}" or "{label+}"
class Segment {
public:
    // Validates 'content' against the rules of 'kind' ('source' only feeds error payloads)
    static PatternResult<Segment> Create(std::string content, SegmentKind kind, std::string_view source = {});

    // Classifies a single token, "{name}" / "{name+}" become labels and anything else
    // is kept verbatim as a literal (so "{foo" is an invalid literal, not a label)
    static PatternResult<Segment> Parse(std::string_view token, std::string_view source = {});

    // vvv Type Checks vvv
    bool IsLiteral()     const;
    bool IsLabel()       const; // True for greedy labels as well
    bool IsGreedyLabel() const;

    // vvv Accessors vvv
    SegmentKind        GetKind()    const;
    const std::string& GetContent() const;
    const std::string& ToString()   const;

    // vvv Comparisons (by rendered form) vvv
    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const;
    bool operator<(const Segment& other)  const;

private:
    Segment(std::string content, SegmentKind kind);

private:
    std::string content_;
    std::string rendered_;
    SegmentKind kind_;
};

} // namespace IDLX::Model

namespace std {

template<>
struct hash<IDLX::Model::Segment> {
    std::size_t operator()(const IDLX::Model::Segment& segment) const
    {
        return std::hash<std::string>{}(segment.ToString());
    }
};

} // namespace std

#endif // IDLX_MODEL_PATTERN_SEGMENT_HPP
