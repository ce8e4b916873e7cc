#ifndef IDLX_MQTT_TOPIC_HPP
#define IDLX_MQTT_TOPIC_HPP

#include "model/pattern/pattern.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace IDLX::Mqtt {

using Model::PatternError;
using Model::PatternResult;

enum class TopicLevelKind : std::uint8_t {
    LITERAL,
    LABEL,
    SINGLE_LEVEL_WILDCARD, // "+"
    MULTI_LEVEL_WILDCARD   // "#", last level only
};

enum class TopicDirection : std::uint8_t {
    PUBLISH,   // Concrete topic names, no wildcards at all
    SUBSCRIBE  // Topic filters
};

const char* TopicLevelKindToString(TopicLevelKind kind);
const char* TopicDirectionToString(TopicDirection direction);

struct TopicLevel {
    std::string    content; // Label name for labels, verbatim text otherwise
    TopicLevelKind kind = TopicLevelKind::LITERAL;

    bool        IsLabel()    const;
    bool        IsWildcard() const;
    std::string ToString()   const;

    bool operator==(const TopicLevel& other) const;
    bool operator!=(const TopicLevel& other) const;
};

// MQTT topic template, "a/{b}/c" for publishing or "a/+/{b}/#" for subscribing
class Topic {
public:
    static PatternResult<Topic> Parse(std::string_view topic, TopicDirection direction = TopicDirection::PUBLISH);

    // vvv Accessors vvv
    const std::vector<TopicLevel>& GetLevels()    const;
    std::vector<TopicLevel>        GetLabels()    const;
    bool                           HasLabel(std::string_view name) const;
    bool                           HasWildcards() const;
    TopicDirection                 GetDirection() const;
    const std::string&             ToString()     const;
    std::string                    Render()       const;

    // Same level count, and every level pair is two labels or two equal non-labels
    bool ConflictsWith(const Topic& other) const;

    // vvv Comparisons (by source text only) vvv
    bool operator==(const Topic& other) const;
    bool operator!=(const Topic& other) const;

private:
    Topic(std::string topic, TopicDirection direction, std::vector<TopicLevel> levels);

private:
    std::string             topic_;
    TopicDirection          direction_;
    std::vector<TopicLevel> levels_;
};

} // namespace IDLX::Mqtt

namespace std {

template<>
struct hash<IDLX::Mqtt::Topic> {
    std::size_t operator()(const IDLX::Mqtt::Topic& topic) const
    {
        return std::hash<std::string>{}(topic.ToString());
    }
};

} // namespace std

#endif // IDLX_MQTT_TOPIC_HPP
