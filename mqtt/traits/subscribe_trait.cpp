#include "subscribe_trait.hpp"

namespace IDLX::Mqtt {

SubscribeTrait::SubscribeTrait(Topic topic)
    : topic_(std::move(topic))
{}

PatternResult<SubscribeTrait> SubscribeTrait::Create(std::string_view topic)
{
    auto parsed = Topic::Parse(topic, TopicDirection::SUBSCRIBE);
    if(auto* error = std::get_if<PatternError>(&parsed))
        return std::move(*error);

    return SubscribeTrait(std::move(std::get<Topic>(parsed)));
}

const Topic& SubscribeTrait::GetTopic() const
{
    return topic_;
}

const std::string& SubscribeTrait::GetValue() const
{
    return topic_.ToString();
}

bool SubscribeTrait::operator==(const SubscribeTrait& other) const
{
    return topic_ == other.topic_;
}

bool SubscribeTrait::operator!=(const SubscribeTrait& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Mqtt
