#ifndef IDLX_MODEL_PATTERN_HPP
#define IDLX_MODEL_PATTERN_HPP

#include "segment.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace IDLX::Model {

/*
 * A validated, ordered series of segments plus the text it was parsed from.
 *
 * Labels are "{label}" and must not repeat (case-insensitive). A greedy label,
 * "{label+}", may appear at most once and must be the last label of the pattern,
 * literals may still follow it. Dialects that can't express greedy matching
 * (host prefixes, topics) build with 'allowsGreedyLabels' = false.
 *
 * Patterns are immutable after Build(), every query is a read-only projection.
 */
class Pattern {
public:
    static PatternResult<Pattern> Build(
        std::string source, std::vector<Segment> segments, bool allowsGreedyLabels = true
    );

    // vvv Accessors vvv
    const std::vector<Segment>& GetSegments()        const;
    std::vector<Segment>        GetLabels()          const;
    const Segment*              GetLabel(std::string_view name) const;
    const Segment*              GetGreedyLabel()     const;
    bool                        AllowsGreedyLabels() const;
    const std::string&          ToString()           const;

    // Joins every segment's rendered form with 'delimiter'
    std::string Render(std::string_view delimiter = {}) const;

    // vvv Comparisons (by source text only) vvv
    bool operator==(const Pattern& other) const;
    bool operator!=(const Pattern& other) const;

private:
    Pattern(std::string source, std::vector<Segment> segments, bool allowsGreedyLabels);

    // Both return false and fill 'outError' on the first violation
    static bool CheckForDuplicateLabels(
        const std::string& source, const std::vector<Segment>& segments, PatternError& outError
    );
    static bool CheckForLabelsAfterGreedyLabels(
        const std::string& source, const std::vector<Segment>& segments, PatternError& outError
    );

private:
    std::string          source_;
    std::vector<Segment> segments_;
    bool                 allowsGreedyLabels_ = true;
};

} // namespace IDLX::Model

namespace std {

template<>
struct hash<IDLX::Model::Pattern> {
    std::size_t operator()(const IDLX::Model::Pattern& pattern) const
    {
        return std::hash<std::string>{}(pattern.ToString());
    }
};

} // namespace std

#endif // IDLX_MODEL_PATTERN_HPP
