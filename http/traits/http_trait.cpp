#include "http_trait.hpp"

namespace IDLX::Http {

using Model::PatternErrorKind;
using Model::MakePatternError;

HttpTrait::HttpTrait(std::string method, UriPattern uri, std::uint16_t code)
    : method_(std::move(method)), uri_(std::move(uri)), code_(code)
{}

static bool IsMethodToken(std::string_view method)
{
    if(method.empty())
        return false;

    for(char c : method)
        if(c < 'A' || c > 'Z')
            return false;

    return true;
}

PatternResult<HttpTrait> HttpTrait::Create(std::string_view method, std::string_view uri, std::int64_t code)
{
    if(!IsMethodToken(method))
        return MakePatternError(
            PatternErrorKind::INVALID_TRAIT_VALUE, method, uri,
            "HTTP method must be an upper-case token. Found `" + std::string{method} + "`"
        );

    if(code < 100 || code > 999)
        return MakePatternError(
            PatternErrorKind::INVALID_TRAIT_VALUE, std::to_string(code), uri,
            "HTTP status code must be between 100 and 999. Found " + std::to_string(code)
        );

    auto parsed = UriPattern::Parse(uri);
    if(auto* error = std::get_if<PatternError>(&parsed))
        return std::move(*error);

    return HttpTrait(std::string{method}, std::move(std::get<UriPattern>(parsed)), static_cast<std::uint16_t>(code));
}

const std::string& HttpTrait::GetMethod() const
{
    return method_;
}

const UriPattern& HttpTrait::GetUri() const
{
    return uri_;
}

std::uint16_t HttpTrait::GetCode() const
{
    return code_;
}

bool HttpTrait::operator==(const HttpTrait& other) const
{
    return method_ == other.method_ && uri_ == other.uri_ && code_ == other.code_;
}

bool HttpTrait::operator!=(const HttpTrait& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Http
