#ifndef IDLX_MODEL_TRAITS_HOST_PREFIX_HPP
#define IDLX_MODEL_TRAITS_HOST_PREFIX_HPP

#include "model/pattern/pattern.hpp"

#include <string_view>
#include <vector>

namespace IDLX::Model {

// Raw slice of a host prefix, either a "{...}" span or a run of literal text
struct HostPrefixToken {
    std::string_view text;
    bool             isLabel = false;
};

// Splits "foo-{bar}.baz" into literal runs and label spans. An opening brace
// without a matching '}' swallows the rest of the text as one literal token
std::vector<HostPrefixToken> TokenizeHostPrefix(std::string_view text);

// Host prefixes never allow greedy labels and two labels must be separated by
// at least one literal character ("{a}{b}" is rejected)
PatternResult<Pattern> ParseHostPrefix(std::string_view text);

} // namespace IDLX::Model

#endif // IDLX_MODEL_TRAITS_HOST_PREFIX_HPP
