#ifndef IDLX_HTTP_TRAITS_HTTP_TRAIT_HPP
#define IDLX_HTTP_TRAITS_HTTP_TRAIT_HPP

#include "http/uri/uri_pattern.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace IDLX::Http {

// smithy.api#http, binds an operation to a method, a URI pattern and a status code
class HttpTrait {
public:
    static constexpr const char*   TRAIT_ID     = "smithy.api#http";
    static constexpr std::uint16_t DEFAULT_CODE = 200;

    static PatternResult<HttpTrait> Create(
        std::string_view method, std::string_view uri, std::int64_t code = DEFAULT_CODE
    );

    const std::string& GetMethod() const;
    const UriPattern&  GetUri()    const;
    std::uint16_t      GetCode()   const;

    bool operator==(const HttpTrait& other) const;
    bool operator!=(const HttpTrait& other) const;

private:
    HttpTrait(std::string method, UriPattern uri, std::uint16_t code);

private:
    std::string   method_;
    UriPattern    uri_;
    std::uint16_t code_;
};

} // namespace IDLX::Http

#endif // IDLX_HTTP_TRAITS_HTTP_TRAIT_HPP
