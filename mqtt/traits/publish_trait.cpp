#include "publish_trait.hpp"

namespace IDLX::Mqtt {

PublishTrait::PublishTrait(Topic topic)
    : topic_(std::move(topic))
{}

PatternResult<PublishTrait> PublishTrait::Create(std::string_view topic)
{
    auto parsed = Topic::Parse(topic, TopicDirection::PUBLISH);
    if(auto* error = std::get_if<PatternError>(&parsed))
        return std::move(*error);

    return PublishTrait(std::move(std::get<Topic>(parsed)));
}

const Topic& PublishTrait::GetTopic() const
{
    return topic_;
}

const std::string& PublishTrait::GetValue() const
{
    return topic_.ToString();
}

bool PublishTrait::operator==(const PublishTrait& other) const
{
    return topic_ == other.topic_;
}

bool PublishTrait::operator!=(const PublishTrait& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Mqtt
