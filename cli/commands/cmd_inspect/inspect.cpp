#include "inspect.hpp"

#include "cli/commands/common/common.hpp"
#include "http/uri/uri_pattern.hpp"
#include "model/traits/host_prefix.hpp"
#include "mqtt/topic/topic.hpp"
#include "utils/logger/logger.hpp"

namespace IDLX::CLI {

using namespace IDLX::Utils; // For 'Logger'
using Model::Pattern;
using Model::PatternError;
using Model::Segment;

// Supported dialects
constexpr static const char* DIALECT_URI       = "uri";
constexpr static const char* DIALECT_HOST      = "host";
constexpr static const char* DIALECT_PUBLISH   = "publish";
constexpr static const char* DIALECT_SUBSCRIBE = "subscribe";

static void PrintSegments(const std::vector<Segment>& segments, const Segment* greedy)
{
    auto& logger = Logger::GetInstance();

    for(std::size_t i = 0; i < segments.size(); ++i)
        logger.Print("  [", i, "] ", Model::SegmentKindToString(segments[i].GetKind()),
                     " ", segments[i].ToString());

    if(greedy)
        logger.Print("  greedy label: ", greedy->GetContent());
}

static int InspectUri(const std::string& text)
{
    auto parsed = Http::UriPattern::Parse(text);
    if(auto* error = std::get_if<PatternError>(&parsed)) {
        ReportPatternError("URI pattern", *error);
        return 1;
    }

    const auto& uri    = std::get<Http::UriPattern>(parsed);
    auto&       logger = Logger::GetInstance();

    logger.Print("URI pattern: ", uri.ToString());
    PrintSegments(uri.GetSegments(), uri.GetGreedyLabel());

    for(const auto& literal : uri.GetQueryLiterals())
        logger.Print("  query: ", literal.key, literal.hasValue ? " = " : "", literal.value);

    return 0;
}

static int InspectHostPrefix(const std::string& text)
{
    auto parsed = Model::ParseHostPrefix(text);
    if(auto* error = std::get_if<PatternError>(&parsed)) {
        ReportPatternError("host prefix", *error);
        return 1;
    }

    const Pattern& pattern = std::get<Pattern>(parsed);

    Logger::GetInstance().Print("Host prefix: ", pattern.ToString());
    PrintSegments(pattern.GetSegments(), nullptr);

    return 0;
}

static int InspectTopic(const std::string& text, Mqtt::TopicDirection direction)
{
    auto parsed = Mqtt::Topic::Parse(text, direction);
    if(auto* error = std::get_if<PatternError>(&parsed)) {
        ReportPatternError("MQTT topic", *error);
        return 1;
    }

    const auto& topic  = std::get<Mqtt::Topic>(parsed);
    auto&       logger = Logger::GetInstance();

    logger.Print("MQTT ", Mqtt::TopicDirectionToString(direction), " topic: ", topic.ToString());

    const auto& levels = topic.GetLevels();
    for(std::size_t i = 0; i < levels.size(); ++i)
        logger.Print("  [", i, "] ", Mqtt::TopicLevelKindToString(levels[i].kind), " ", levels[i].ToString());

    return 0;
}

int InspectTemplate(const std::string& dialect, const std::string& text)
{
    if(dialect == DIALECT_URI)
        return InspectUri(text);

    if(dialect == DIALECT_HOST)
        return InspectHostPrefix(text);

    if(dialect == DIALECT_PUBLISH)
        return InspectTopic(text, Mqtt::TopicDirection::PUBLISH);

    if(dialect == DIALECT_SUBSCRIBE)
        return InspectTopic(text, Mqtt::TopicDirection::SUBSCRIBE);

    Logger::GetInstance().Error(
        "[IDLX]: Unknown dialect '", dialect, "'. Supported dialects: 'uri', 'host', 'publish', 'subscribe'"
    );
    return 2;
}

} // namespace IDLX::CLI
