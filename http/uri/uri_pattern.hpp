#ifndef IDLX_HTTP_URI_PATTERN_HPP
#define IDLX_HTTP_URI_PATTERN_HPP

#include "model/pattern/pattern.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace IDLX::Http {

using Model::Pattern;
using Model::PatternError;
using Model::PatternResult;
using Model::Segment;

// "?key" or "?key=value" part of a URI pattern, never contains labels
struct QueryLiteral {
    std::string key;
    std::string value;
    bool        hasValue = false; // "?k=" keeps its '=' even though 'value' is empty
};

/*
 * "/path/{label}/{rest+}?literal=value"
 * Path segments are split on '/' and share the generic pattern grammar (greedy
 * labels allowed). The query string only holds fixed literals.
 */
class UriPattern {
public:
    static PatternResult<UriPattern> Parse(std::string_view uri);

    // vvv Accessors vvv
    const Pattern&                   GetPattern()       const;
    const std::vector<Segment>&      GetSegments()      const;
    std::vector<Segment>             GetLabels()        const;
    const Segment*                   GetLabel(std::string_view name) const;
    const Segment*                   GetGreedyLabel()   const;
    const std::vector<QueryLiteral>& GetQueryLiterals() const;
    const std::string*               GetQueryLiteral(std::string_view key) const;
    const std::string&               ToString()         const;
    std::string                      Render()           const;

    // True when a request could be routed to both patterns
    bool ConflictsWith(const UriPattern& other) const;

    bool operator==(const UriPattern& other) const;
    bool operator!=(const UriPattern& other) const;

private:
    UriPattern(Pattern pattern, std::vector<QueryLiteral> queryLiterals);

    static bool ParseQueryLiterals(
        std::string_view query, std::string_view uri,
        std::vector<QueryLiteral>& outLiterals, PatternError& outError
    );
    bool HasSameQueryLiterals(const UriPattern& other) const;

private:
    Pattern                   pattern_;
    std::vector<QueryLiteral> queryLiterals_;
};

} // namespace IDLX::Http

#endif // IDLX_HTTP_URI_PATTERN_HPP
