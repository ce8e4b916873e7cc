#include "pattern.hpp"

#include "utils/string/string.hpp"

#include <unordered_set>

namespace IDLX::Model {

using namespace IDLX::Utils; // For 'CaseInsensitiveHash', 'CaseInsensitiveCompare'

Pattern::Pattern(std::string source, std::vector<Segment> segments, bool allowsGreedyLabels)
    : source_(std::move(source)), segments_(std::move(segments)), allowsGreedyLabels_(allowsGreedyLabels)
{}

PatternResult<Pattern> Pattern::Build(std::string source, std::vector<Segment> segments, bool allowsGreedyLabels)
{
    PatternError error;

    if(!CheckForDuplicateLabels(source, segments, error))
        return error;

    if(allowsGreedyLabels) {
        if(!CheckForLabelsAfterGreedyLabels(source, segments, error))
            return error;
    }
    else {
        for(const auto& segment : segments)
            if(segment.IsGreedyLabel())
                return MakePatternError(PatternErrorKind::GREEDY_LABEL_NOT_ALLOWED, segment.ToString(), source);
    }

    return Pattern(std::move(source), std::move(segments), allowsGreedyLabels);
}

bool Pattern::CheckForDuplicateLabels(
    const std::string& source, const std::vector<Segment>& segments, PatternError& outError
)
{
    std::unordered_set<std::string_view, CaseInsensitiveHash, CaseInsensitiveEqual> seen;

    for(const auto& segment : segments) {
        if(!segment.IsLabel())
            continue;

        if(!seen.insert(segment.GetContent()).second) {
            outError = MakePatternError(PatternErrorKind::DUPLICATE_LABEL, segment.GetContent(), source);
            return false;
        }
    }

    return true;
}

bool Pattern::CheckForLabelsAfterGreedyLabels(
    const std::string& source, const std::vector<Segment>& segments, PatternError& outError
)
{
    // At most one greedy label, and it has to be the last label segment
    for(std::size_t i = 0; i < segments.size(); ++i) {
        if(!segments[i].IsGreedyLabel())
            continue;

        for(std::size_t j = i + 1; j < segments.size(); ++j) {
            if(segments[j].IsGreedyLabel()) {
                outError = MakePatternError(PatternErrorKind::MULTIPLE_GREEDY_LABELS, segments[j].GetContent(), source);
                return false;
            }
            if(segments[j].IsLabel()) {
                outError = MakePatternError(PatternErrorKind::GREEDY_LABEL_NOT_LAST, segments[i].GetContent(), source);
                return false;
            }
        }
    }

    return true;
}

// vvv Accessors vvv
const std::vector<Segment>& Pattern::GetSegments() const
{
    return segments_;
}

std::vector<Segment> Pattern::GetLabels() const
{
    std::vector<Segment> labels;
    for(const auto& segment : segments_)
        if(segment.IsLabel())
            labels.push_back(segment);

    return labels;
}

const Segment* Pattern::GetLabel(std::string_view name) const
{
    for(const auto& segment : segments_)
        if(segment.IsLabel() && CaseInsensitiveCompare(segment.GetContent(), name))
            return &segment;

    return nullptr;
}

const Segment* Pattern::GetGreedyLabel() const
{
    for(const auto& segment : segments_)
        if(segment.IsGreedyLabel())
            return &segment;

    return nullptr;
}

bool Pattern::AllowsGreedyLabels() const
{
    return allowsGreedyLabels_;
}

const std::string& Pattern::ToString() const
{
    return source_;
}

std::string Pattern::Render(std::string_view delimiter) const
{
    std::string rendered;
    for(std::size_t i = 0; i < segments_.size(); ++i) {
        if(i > 0)
            rendered.append(delimiter);
        rendered.append(segments_[i].ToString());
    }

    return rendered;
}

// vvv Comparisons vvv
bool Pattern::operator==(const Pattern& other) const
{
    return source_ == other.source_;
}

bool Pattern::operator!=(const Pattern& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Model
