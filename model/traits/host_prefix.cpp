#include "host_prefix.hpp"

#include <string>

namespace IDLX::Model {

std::vector<HostPrefixToken> TokenizeHostPrefix(std::string_view text)
{
    std::vector<HostPrefixToken> tokens;

    std::size_t pos          = 0;
    std::size_t literalStart = 0;

    while(pos < text.size()) {
        if(text[pos] != '{') {
            ++pos;
            continue;
        }

        if(pos > literalStart)
            tokens.push_back({ text.substr(literalStart, pos - literalStart), false });

        std::size_t close = text.find('}', pos);
        if(close == std::string_view::npos) {
            // Unclosed, leave it to literal validation to reject
            literalStart = pos;
            break;
        }

        tokens.push_back({ text.substr(pos, close - pos + 1), true });
        pos          = close + 1;
        literalStart = pos;
    }

    if(literalStart < text.size())
        tokens.push_back({ text.substr(literalStart), false });

    return tokens;
}

// Same failure kind as the generic parser, but host prefixes tell the two brace
// problems apart for the user
static PatternError RefineLiteralError(PatternError error, std::string_view token, std::string_view text)
{
    if(error.kind != PatternErrorKind::ILLEGAL_LITERAL_CHARACTER)
        return error;

    if(token.find('{') != std::string_view::npos)
        error.message = "Unclosed label found in pattern `" + std::string{text} + "`";
    else
        error.message = "Literal segments must not contain `}` characters. Found segment `"
                      + std::string{token} + "` in pattern `" + std::string{text} + "`";

    return error;
}

PatternResult<Pattern> ParseHostPrefix(std::string_view text)
{
    if(text.empty())
        return MakePatternError(
            PatternErrorKind::EMPTY_SEGMENT, text, text, "Host prefix patterns must not be empty"
        );

    std::vector<HostPrefixToken> tokens = TokenizeHostPrefix(text);
    std::vector<Segment>         segments;
    segments.reserve(tokens.size());

    for(const auto& token : tokens) {
        auto parsed = Segment::Parse(token.text, text);
        if(auto* error = std::get_if<PatternError>(&parsed))
            return RefineLiteralError(std::move(*error), token.text, text);

        segments.push_back(std::move(std::get<Segment>(parsed)));
    }

    auto built = Pattern::Build(std::string{text}, std::move(segments), false);
    if(std::holds_alternative<PatternError>(built))
        return built;

    // Adjacency is about the source text, so look at the raw tokens
    for(std::size_t i = 1; i < tokens.size(); ++i) {
        if(tokens[i - 1].isLabel && tokens[i].isLabel) {
            std::string pair = std::string{tokens[i - 1].text} + std::string{tokens[i].text};
            return MakePatternError(PatternErrorKind::ADJACENT_LABELS, pair, text);
        }
    }

    return built;
}

} // namespace IDLX::Model
