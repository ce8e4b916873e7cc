#ifndef IDLX_MQTT_TRAITS_PUBLISH_TRAIT_HPP
#define IDLX_MQTT_TRAITS_PUBLISH_TRAIT_HPP

#include "mqtt/topic/topic.hpp"

#include <string>
#include <string_view>

namespace IDLX::Mqtt {

// smithy.mqtt#publish, the topic an operation publishes to (no wildcards)
class PublishTrait {
public:
    static constexpr const char* TRAIT_ID = "smithy.mqtt#publish";

    static PatternResult<PublishTrait> Create(std::string_view topic);

    const Topic&       GetTopic() const;
    const std::string& GetValue() const;

    bool operator==(const PublishTrait& other) const;
    bool operator!=(const PublishTrait& other) const;

private:
    explicit PublishTrait(Topic topic);

private:
    Topic topic_;
};

} // namespace IDLX::Mqtt

#endif // IDLX_MQTT_TRAITS_PUBLISH_TRAIT_HPP
