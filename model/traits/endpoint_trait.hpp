#ifndef IDLX_MODEL_TRAITS_ENDPOINT_TRAIT_HPP
#define IDLX_MODEL_TRAITS_ENDPOINT_TRAIT_HPP

#include "host_prefix.hpp"

#include <string>

namespace IDLX::Model {

// smithy.api#endpoint, the parsed host prefix is a cached view of 'hostPrefix'
class EndpointTrait {
public:
    static constexpr const char* TRAIT_ID = "smithy.api#endpoint";

    static PatternResult<EndpointTrait> Create(std::string_view hostPrefix);

    const Pattern&     GetHostPrefix() const;
    const std::string& GetValue()      const;

    bool operator==(const EndpointTrait& other) const;
    bool operator!=(const EndpointTrait& other) const;

private:
    explicit EndpointTrait(Pattern hostPrefix);

private:
    Pattern hostPrefix_;
};

} // namespace IDLX::Model

#endif // IDLX_MODEL_TRAITS_ENDPOINT_TRAIT_HPP
