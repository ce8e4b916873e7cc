#ifndef IDLX_MQTT_TRAITS_SUBSCRIBE_TRAIT_HPP
#define IDLX_MQTT_TRAITS_SUBSCRIBE_TRAIT_HPP

#include "mqtt/topic/topic.hpp"

#include <string>
#include <string_view>

namespace IDLX::Mqtt {

// smithy.mqtt#subscribe, a topic filter (wildcards allowed, '#' last)
class SubscribeTrait {
public:
    static constexpr const char* TRAIT_ID = "smithy.mqtt#subscribe";

    static PatternResult<SubscribeTrait> Create(std::string_view topic);

    const Topic&       GetTopic() const;
    const std::string& GetValue() const;

    bool operator==(const SubscribeTrait& other) const;
    bool operator!=(const SubscribeTrait& other) const;

private:
    explicit SubscribeTrait(Topic topic);

private:
    Topic topic_;
};

} // namespace IDLX::Mqtt

#endif // IDLX_MQTT_TRAITS_SUBSCRIBE_TRAIT_HPP
