/*
 * Build: g++ -std=c++17 -O2 -I. test/pattern_test.cpp\
          model/pattern/pattern.cpp\
          model/pattern/segment.cpp\
          model/pattern/pattern_error.cpp\
          utils/string/string.cpp\
          -o pattern_test
 */

#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "model/pattern/pattern.hpp"
#include "utils/string/string.hpp"

using namespace IDLX::Model;
using IDLX::Utils::SplitOn;

static int failures = 0;

static void Expect(bool condition, const char* testName)
{
    if(!condition) {
        std::cerr << "[FAIL] " << testName << "\n";
        ++failures;
    }
    else
        std::cout << "[PASS] " << testName << "\n";
}

// Tokens are expected to be individually valid, only Build() is under test here
static PatternResult<Pattern> BuildFrom(
    const std::string& source, std::initializer_list<const char*> tokens, bool allowsGreedyLabels = true
)
{
    std::vector<Segment> segments;
    for(const char* token : tokens)
        segments.push_back(std::get<Segment>(Segment::Parse(token, source)));

    return Pattern::Build(source, std::move(segments), allowsGreedyLabels);
}

static bool FailsWith(const PatternResult<Pattern>& result, PatternErrorKind kind)
{
    auto* error = std::get_if<PatternError>(&result);
    return error && error->kind == kind;
}

void RunPatternTests()
{
    // === Queries on a valid pattern ===
    {
        auto built = BuildFrom("a/{b}/{c+}", { "a", "{b}", "{c+}" });
        Expect(std::holds_alternative<Pattern>(built), "Literal, label and trailing greedy label build");

        if(auto* pattern = std::get_if<Pattern>(&built)) {
            Expect(pattern->GetSegments().size() == 3,  "All segments kept in order");
            Expect(pattern->GetLabels().size() == 2,    "Greedy labels count as labels");
            Expect(pattern->GetGreedyLabel() && pattern->GetGreedyLabel()->GetContent() == "c",
                   "Greedy label lookup");
            Expect(pattern->GetLabel("B") && pattern->GetLabel("B")->GetContent() == "b",
                   "Label lookup is case-insensitive");
            Expect(pattern->GetLabel("a") == nullptr,   "Literals are not returned as labels");
            Expect(pattern->GetLabel("zz") == nullptr,  "Unknown label lookup");
            Expect(pattern->ToString() == "a/{b}/{c+}", "ToString returns the source text");
            Expect(pattern->Render("/") == "a/{b}/{c+}", "Render joins rendered segments");
            Expect(pattern->AllowsGreedyLabels(),       "Greedy flag recorded");
        }
    }

    {
        auto built = BuildFrom("x{y}", { "x", "{y}" });
        auto* pattern = std::get_if<Pattern>(&built);
        Expect(pattern && pattern->GetGreedyLabel() == nullptr, "No greedy label yields null");
        Expect(pattern && pattern->Render() == "x{y}",          "Render without delimiter");
    }

    // === Duplicate labels in any case ===
    for(const char* other : { "{foo}", "{FOO}", "{Foo}", "{fOo+}" }) {
        auto built = BuildFrom("{foo}/{x}", { "{foo}", "x", other });
        std::string name = std::string{"Duplicate label "} + other;
        Expect(FailsWith(built, PatternErrorKind::DUPLICATE_LABEL), name.c_str());
    }

    {
        auto built = BuildFrom("/{Id}/{id}", { "{Id}", "{id}" });
        auto* error = std::get_if<PatternError>(&built);
        Expect(error && error->content == "id" && error->message.find("/{Id}/{id}") != std::string::npos,
               "Duplicate label error names the second label and the pattern");
    }

    Expect(std::holds_alternative<Pattern>(BuildFrom("{foo}foo", { "{foo}", "foo" })),
           "Literal text matching a label name is not a duplicate");

    // === Greedy placement ===
    Expect(FailsWith(BuildFrom("{a+}/{b}", { "{a+}", "{b}" }), PatternErrorKind::GREEDY_LABEL_NOT_LAST),
           "Label after greedy label");
    Expect(FailsWith(BuildFrom("{a+}/{b+}", { "{a+}", "{b+}" }), PatternErrorKind::MULTIPLE_GREEDY_LABELS),
           "Two greedy labels");
    Expect(std::holds_alternative<Pattern>(BuildFrom("{a+}/x/y", { "{a+}", "x", "y" })),
           "Literals may follow a greedy label");
    Expect(FailsWith(BuildFrom("{a+}", { "{a+}" }, false), PatternErrorKind::GREEDY_LABEL_NOT_ALLOWED),
           "Greedy label rejected when the dialect forbids it");
    Expect(std::holds_alternative<Pattern>(BuildFrom("{a}.{b}", { "{a}", ".", "{b}" }, false)),
           "Plain labels fine without greedy support");

    // === Empty pattern ===
    {
        auto built = Pattern::Build("", {});
        auto* pattern = std::get_if<Pattern>(&built);
        Expect(pattern && pattern->GetSegments().empty() && pattern->Render("/").empty(),
               "Pattern without segments");
    }

    // === Equality and hashing by source text ===
    {
        Pattern lhs = std::get<Pattern>(BuildFrom("same", { "a" }));
        Pattern rhs = std::get<Pattern>(BuildFrom("same", { "{b}" }));
        Pattern diff = std::get<Pattern>(BuildFrom("other", { "a" }));

        Expect(lhs == rhs,   "Patterns with the same source are equal");
        Expect(lhs != diff,  "Patterns with different sources differ");
        Expect(std::hash<Pattern>{}(lhs) == std::hash<Pattern>{}(rhs), "Equal patterns hash equally");
    }

    // === Rendered text parses back to an equal pattern ===
    {
        Pattern original = std::get<Pattern>(BuildFrom("a/{b}/{c+}", { "a", "{b}", "{c+}" }));
        std::string rendered = original.Render("/");

        std::vector<Segment> segments;
        bool parsedAll = true;
        for(std::string_view token : SplitOn(rendered, '/')) {
            auto parsed = Segment::Parse(token, rendered);
            if(!std::holds_alternative<Segment>(parsed)) {
                parsedAll = false;
                break;
            }
            segments.push_back(std::get<Segment>(parsed));
        }

        auto reparsed = Pattern::Build(rendered, std::move(segments));
        auto* pattern = std::get_if<Pattern>(&reparsed);

        Expect(parsedAll && pattern && *pattern == original && pattern->GetSegments() == original.GetSegments(),
               "Reparsed rendered text equals original");
    }

    if(failures > 0) {
        std::cerr << "[Pattern Test] " << failures << " test(s) FAILED!\n";
        std::exit(1);
    }

    std::cout << "[Pattern Test] All tests passed.\n";
}

int main()
{
    RunPatternTests();
    return 0;
}
