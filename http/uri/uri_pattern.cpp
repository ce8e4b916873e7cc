#include "uri_pattern.hpp"

#include "utils/string/string.hpp"

#include <algorithm>

namespace IDLX::Http {

using namespace IDLX::Utils; // For 'SplitOn'
using Model::PatternErrorKind;
using Model::MakePatternError;

UriPattern::UriPattern(Pattern pattern, std::vector<QueryLiteral> queryLiterals)
    : pattern_(std::move(pattern)), queryLiterals_(std::move(queryLiterals))
{}

PatternResult<UriPattern> UriPattern::Parse(std::string_view uri)
{
    std::string src{uri};

    if(uri.empty() || uri.front() != '/')
        return MakePatternError(
            PatternErrorKind::MALFORMED_URI, uri, uri, "URI pattern must start with '/'. Found `" + src + "`"
        );

    if(uri.back() == '?')
        return MakePatternError(
            PatternErrorKind::MALFORMED_URI, uri, uri, "URI patterns must not end with '?'. Found `" + src + "`"
        );

    if(uri.find('#') != std::string_view::npos)
        return MakePatternError(
            PatternErrorKind::MALFORMED_URI, uri, uri, "URI pattern must not contain a fragment. Found `" + src + "`"
        );

    std::size_t      queryPos = uri.find('?');
    std::string_view path     = uri.substr(0, queryPos);

    std::vector<Segment> segments;

    // "/" on its own is the root and has no segments
    if(path.size() > 1) {
        for(std::string_view piece : SplitOn(path.substr(1), '/')) {
            auto parsed = Segment::Parse(piece, uri);
            if(auto* error = std::get_if<PatternError>(&parsed))
                return std::move(*error);

            segments.push_back(std::move(std::get<Segment>(parsed)));
        }
    }

    std::vector<QueryLiteral> queryLiterals;
    if(queryPos != std::string_view::npos) {
        PatternError error;
        if(!ParseQueryLiterals(uri.substr(queryPos + 1), uri, queryLiterals, error))
            return error;
    }

    auto built = Pattern::Build(std::move(src), std::move(segments), true);
    if(auto* error = std::get_if<PatternError>(&built))
        return std::move(*error);

    return UriPattern(std::move(std::get<Pattern>(built)), std::move(queryLiterals));
}

bool UriPattern::ParseQueryLiterals(
    std::string_view query, std::string_view uri,
    std::vector<QueryLiteral>& outLiterals, PatternError& outError
)
{
    for(std::string_view param : SplitOn(query, '&')) {
        if(param.find_first_of("{}") != std::string_view::npos) {
            outError = MakePatternError(
                PatternErrorKind::INVALID_QUERY_LITERAL, param, uri,
                "URI query string must not contain labels. Found `" + std::string{param}
                + "` in `" + std::string{uri} + "`"
            );
            return false;
        }

        std::size_t      eq    = param.find('=');
        std::string_view key   = param.substr(0, eq);
        std::string_view value = (eq == std::string_view::npos) ? std::string_view{} : param.substr(eq + 1);

        if(key.empty()) {
            outError = MakePatternError(PatternErrorKind::INVALID_QUERY_LITERAL, param, uri);
            return false;
        }

        for(const auto& existing : outLiterals) {
            if(existing.key == key) {
                outError = MakePatternError(
                    PatternErrorKind::INVALID_QUERY_LITERAL, key, uri,
                    "Literal query parameters must not be repeated: `" + std::string{key}
                    + "` in `" + std::string{uri} + "`"
                );
                return false;
            }
        }

        outLiterals.push_back({ std::string{key}, std::string{value}, eq != std::string_view::npos });
    }

    return true;
}

// vvv Accessors vvv
const Pattern& UriPattern::GetPattern() const
{
    return pattern_;
}

const std::vector<Segment>& UriPattern::GetSegments() const
{
    return pattern_.GetSegments();
}

std::vector<Segment> UriPattern::GetLabels() const
{
    return pattern_.GetLabels();
}

const Segment* UriPattern::GetLabel(std::string_view name) const
{
    return pattern_.GetLabel(name);
}

const Segment* UriPattern::GetGreedyLabel() const
{
    return pattern_.GetGreedyLabel();
}

const std::vector<QueryLiteral>& UriPattern::GetQueryLiterals() const
{
    return queryLiterals_;
}

const std::string* UriPattern::GetQueryLiteral(std::string_view key) const
{
    for(const auto& literal : queryLiterals_)
        if(literal.key == key)
            return &literal.value;

    return nullptr;
}

const std::string& UriPattern::ToString() const
{
    return pattern_.ToString();
}

std::string UriPattern::Render() const
{
    std::string rendered = "/" + pattern_.Render("/");

    for(std::size_t i = 0; i < queryLiterals_.size(); ++i) {
        rendered.push_back(i == 0 ? '?' : '&');
        rendered.append(queryLiterals_[i].key);

        if(queryLiterals_[i].hasValue) {
            rendered.push_back('=');
            rendered.append(queryLiterals_[i].value);
        }
    }

    return rendered;
}

// vvv Conflicts vvv
bool UriPattern::ConflictsWith(const UriPattern& other) const
{
    const auto& mine   = GetSegments();
    const auto& theirs = other.GetSegments();

    std::size_t common = std::min(mine.size(), theirs.size());

    for(std::size_t i = 0; i < common; ++i) {
        const Segment& lhs = mine[i];
        const Segment& rhs = theirs[i];

        // Literals always win over labels when routing
        if(lhs.IsLabel() != rhs.IsLabel())
            return false;

        if(lhs.IsLiteral()) {
            if(lhs.GetContent() != rhs.GetContent())
                return false;
            continue;
        }

        if(lhs.IsGreedyLabel() || rhs.IsGreedyLabel())
            return HasSameQueryLiterals(other);
    }

    return mine.size() == theirs.size() && HasSameQueryLiterals(other);
}

bool UriPattern::HasSameQueryLiterals(const UriPattern& other) const
{
    if(queryLiterals_.size() != other.queryLiterals_.size())
        return false;

    for(const auto& literal : queryLiterals_) {
        const std::string* value = other.GetQueryLiteral(literal.key);
        if(!value || *value != literal.value)
            return false;
    }

    return true;
}

bool UriPattern::operator==(const UriPattern& other) const
{
    return pattern_ == other.pattern_;
}

bool UriPattern::operator!=(const UriPattern& other) const
{
    return !(*this == other);
}

} // namespace IDLX::Http
