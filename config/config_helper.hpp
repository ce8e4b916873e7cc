#ifndef IDLX_CONFIG_HELPERS_HPP
#define IDLX_CONFIG_HELPERS_HPP

#include "utils/logger/logger.hpp"
#include <toml++/toml.hpp>
#include <string>
#include <string_view>

namespace IDLX::Core::ConfigHelpers {

using IDLX::Utils::Logger;

// vvv Helper Helper Functions vvv
inline toml::node_view<const toml::node> ResolveTomlPath(const toml::table& tbl, const char* section)
{
    toml::node_view<const toml::node> node{tbl};

    const char* p = section;
    const char* segment_start = p;

    while(true) {
        // Find the next '.' or '\0'
        while(*p != '\0' && *p != '.')
            ++p;

        std::string_view key(segment_start,
                             static_cast<std::size_t>(p - segment_start));

        node = node[key];
        if(!node || !node.is_table())
            return {}; // Invalid path or missing table

        if(*p == '\0')
            break;      // Reached end of string

        // Skip '.', next segment starts after it
        ++p;
        segment_start = p;
    }

    return node;
}

// vvv Helper Functions vvv
// Missing entries keep 'target' quietly, entries of the wrong type are worth a warning
template<typename T>
bool ExtractValue(
    const toml::table& tbl, const char* section, const char* field, T& target
)
{
    auto& logger = Logger::GetInstance();

    auto node = ResolveTomlPath(tbl, section);
    if(!node || !node[field]) {
        logger.Debug("[Config]: No entry for [", section, "] ", field, ". Using default value: ", target);
        return false;
    }

    if(auto val = node[field].value<T>()) {
        target = *val;
        return true;
    }

    logger.Warn(
        "[Config]: Invalid entry: [", section, "] ", field,
        ". Using default value: ", target
    );
    return false;
}

} // namespace IDLX::Core::ConfigHelpers

#endif // IDLX_CONFIG_HELPERS_HPP
