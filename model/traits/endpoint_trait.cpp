#include "endpoint_trait.hpp"

namespace IDLX::Model {

EndpointTrait::EndpointTrait(Pattern hostPrefix)
    : hostPrefix_(std::move(hostPrefix))
{}

PatternResult<EndpointTrait> EndpointTrait::Create(std::string_view hostPrefix)
{
    auto parsed = ParseHostPrefix(hostPrefix);
    if(auto* error = std::get_if<PatternError>(&parsed))
        return std::move(*error);

    return EndpointTrait(std::move(std::get<Pattern>(parsed)));
}

const Pattern& EndpointTrait::GetHostPrefix() const
{
    return hostPrefix_;
}

const std::string& EndpointTrait::GetValue() const
{
    return hostPrefix_.ToString();
}

bool EndpointTrait::operator==(const EndpointTrait& other) const
{
    return hostPrefix_ == other.hostPrefix_;
}

bool EndpointTrait::operator!=(const EndpointTrait& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Model
