#include "topic.hpp"

#include "utils/string/string.hpp"

namespace IDLX::Mqtt {

using namespace IDLX::Utils; // For 'SplitOn', 'CaseInsensitiveCompare'
using Model::MakePatternError;
using Model::Pattern;
using Model::PatternErrorKind;
using Model::Segment;

const char* TopicLevelKindToString(TopicLevelKind kind)
{
    switch(kind) {
        case TopicLevelKind::LITERAL:               return "literal";
        case TopicLevelKind::LABEL:                 return "label";
        case TopicLevelKind::SINGLE_LEVEL_WILDCARD: return "single_level_wildcard";
        case TopicLevelKind::MULTI_LEVEL_WILDCARD:  return "multi_level_wildcard";
        default:                                    return "unknown";
    }
}

const char* TopicDirectionToString(TopicDirection direction)
{
    return direction == TopicDirection::PUBLISH ? "publish" : "subscribe";
}

// vvv TopicLevel vvv
bool TopicLevel::IsLabel() const
{
    return kind == TopicLevelKind::LABEL;
}

bool TopicLevel::IsWildcard() const
{
    return kind == TopicLevelKind::SINGLE_LEVEL_WILDCARD || kind == TopicLevelKind::MULTI_LEVEL_WILDCARD;
}

std::string TopicLevel::ToString() const
{
    return IsLabel() ? "{" + content + "}" : content;
}

bool TopicLevel::operator==(const TopicLevel& other) const
{
    return kind == other.kind && content == other.content;
}

bool TopicLevel::operator!=(const TopicLevel& other) const
{
    return !(*this == other);
}

// vvv Topic vvv
Topic::Topic(std::string topic, TopicDirection direction, std::vector<TopicLevel> levels)
    : topic_(std::move(topic)), direction_(direction), levels_(std::move(levels))
{}

PatternResult<Topic> Topic::Parse(std::string_view topic, TopicDirection direction)
{
    std::string src{topic};

    std::vector<std::string_view> rawLevels = SplitOn(topic, '/');
    std::vector<TopicLevel>       levels;
    std::vector<Segment>          segments;

    levels.reserve(rawLevels.size());

    for(std::size_t i = 0; i < rawLevels.size(); ++i) {
        std::string_view level = rawLevels[i];

        if(level == "+" || level == "#") {
            if(direction == TopicDirection::PUBLISH)
                return MakePatternError(
                    PatternErrorKind::ILLEGAL_WILDCARD, level, topic,
                    "Wildcard levels are not allowed in MQTT publish topics. Found `"
                    + std::string{level} + "` in `" + src + "`"
                );

            if(level == "#" && i + 1 != rawLevels.size())
                return MakePatternError(
                    PatternErrorKind::ILLEGAL_WILDCARD, level, topic,
                    "The multi-level wildcard `#` must be the last level of a topic filter. Found `" + src + "`"
                );

            levels.push_back({
                std::string{level},
                level == "+" ? TopicLevelKind::SINGLE_LEVEL_WILDCARD : TopicLevelKind::MULTI_LEVEL_WILDCARD
            });
            continue;
        }

        bool spansLevel = level.size() >= 2 && level.front() == '{' && level.back() == '}';

        if(!spansLevel && level.find_first_of("{}") != std::string_view::npos)
            return MakePatternError(
                PatternErrorKind::ILLEGAL_LITERAL_CHARACTER, level, topic,
                "Topic labels must span an entire level. Found `" + std::string{level} + "` in `" + src + "`"
            );

        if(!spansLevel && level.find_first_of("+#") != std::string_view::npos)
            return MakePatternError(
                PatternErrorKind::ILLEGAL_WILDCARD, level, topic,
                direction == TopicDirection::PUBLISH
                    ? "Wildcard levels are not allowed in MQTT publish topics. Found `"
                      + std::string{level} + "` in `" + src + "`"
                    : "Wildcards must occupy an entire topic level. Found `"
                      + std::string{level} + "` in `" + src + "`"
            );

        auto parsed = Segment::Parse(level, topic);
        if(auto* error = std::get_if<PatternError>(&parsed))
            return std::move(*error);

        Segment& segment = std::get<Segment>(parsed);
        levels.push_back({
            segment.GetContent(),
            segment.IsLabel() ? TopicLevelKind::LABEL : TopicLevelKind::LITERAL
        });
        segments.push_back(std::move(segment));
    }

    // Label naming and uniqueness rules are the generic ones, "{name+}" included
    auto built = Pattern::Build(src, std::move(segments), false);
    if(auto* error = std::get_if<PatternError>(&built))
        return std::move(*error);

    return Topic(std::move(src), direction, std::move(levels));
}

// vvv Accessors vvv
const std::vector<TopicLevel>& Topic::GetLevels() const
{
    return levels_;
}

std::vector<TopicLevel> Topic::GetLabels() const
{
    std::vector<TopicLevel> labels;
    for(const auto& level : levels_)
        if(level.IsLabel())
            labels.push_back(level);

    return labels;
}

bool Topic::HasLabel(std::string_view name) const
{
    for(const auto& level : levels_)
        if(level.IsLabel() && CaseInsensitiveCompare(level.content, name))
            return true;

    return false;
}

bool Topic::HasWildcards() const
{
    for(const auto& level : levels_)
        if(level.IsWildcard())
            return true;

    return false;
}

TopicDirection Topic::GetDirection() const
{
    return direction_;
}

const std::string& Topic::ToString() const
{
    return topic_;
}

std::string Topic::Render() const
{
    std::string rendered;
    for(std::size_t i = 0; i < levels_.size(); ++i) {
        if(i > 0)
            rendered.push_back('/');
        rendered.append(levels_[i].ToString());
    }

    return rendered;
}

bool Topic::ConflictsWith(const Topic& other) const
{
    if(levels_.size() != other.levels_.size())
        return false;

    for(std::size_t i = 0; i < levels_.size(); ++i) {
        const TopicLevel& lhs = levels_[i];
        const TopicLevel& rhs = other.levels_[i];

        if(lhs.IsLabel() && rhs.IsLabel())
            continue;

        if(lhs != rhs)
            return false;
    }

    return true;
}

// vvv Comparisons vvv
bool Topic::operator==(const Topic& other) const
{
    return topic_ == other.topic_;
}

bool Topic::operator!=(const Topic& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Mqtt
