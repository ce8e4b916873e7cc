/*
 * Build: g++ -std=c++17 -O2 -I. test/manifest_test.cpp\
          manifest/manifest.cpp\
          config/config.cpp\
          http/uri/uri_pattern.cpp\
          http/traits/http_trait.cpp\
          model/traits/host_prefix.cpp\
          model/traits/endpoint_trait.cpp\
          mqtt/topic/topic.cpp\
          mqtt/traits/publish_trait.cpp\
          mqtt/traits/subscribe_trait.cpp\
          model/pattern/pattern.cpp\
          model/pattern/segment.cpp\
          model/pattern/pattern_error.cpp\
          utils/string/string.cpp\
          utils/logger/logger.cpp\
          -o manifest_test
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include "config/config.hpp"
#include "manifest/manifest.hpp"
#include "utils/logger/logger.hpp"

using namespace IDLX::Core;
using IDLX::Model::PatternErrorKind;
using IDLX::Utils::Logger;

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

static const Diagnostic* FindByKind(const Manifest& manifest, PatternErrorKind kind)
{
    for(const auto& diagnostic : manifest.GetDiagnostics())
        if(diagnostic.patternErrorKind == kind)
            return &diagnostic;

    return nullptr;
}

static const Diagnostic* FindByMessage(const Manifest& manifest, const char* part)
{
    for(const auto& diagnostic : manifest.GetDiagnostics())
        if(diagnostic.message.find(part) != std::string::npos)
            return &diagnostic;

    return nullptr;
}

static void RunManifestLoadingTests()
{
    CheckConfig defaults;

    // === Valid manifest ===
    {
        const char* doc =
            "[service]\n"
            "name = \"Weather\"\n"
            "\n"
            "[[operation]]\n"
            "name = \"GetCity\"\n"
            "http = { method = \"GET\", uri = \"/cities/{cityId}\" }\n"
            "endpoint = { host_prefix = \"{region}.data-\" }\n"
            "mqtt_publish = \"cities/{cityId}/events\"\n"
            "\n"
            "[[operation]]\n"
            "name = \"CreateCity\"\n"
            "http = { method = \"POST\", uri = \"/cities\", code = 201 }\n"
            "\n"
            "[[operation]]\n"
            "name = \"WatchAlerts\"\n"
            "mqtt_subscribe = \"cities/+/alerts/#\"\n";

        Manifest manifest = Manifest::LoadString(doc, "weather.toml", defaults);

        Expect(manifest.IsValid() && manifest.GetDiagnostics().empty(), "Valid manifest has no diagnostics");
        Expect(manifest.GetServiceName() == "Weather",  "Service name read");
        Expect(manifest.GetOperations().size() == 3,     "All operations loaded");

        const OperationBinding* getCity = manifest.GetOperation("GetCity");
        Expect(getCity && getCity->http && getCity->http->GetCode() == 200,       "Default HTTP code");
        Expect(getCity && getCity->endpoint
               && getCity->endpoint->GetHostPrefix().GetLabel("region") != nullptr, "Endpoint trait bound");
        Expect(getCity && getCity->publish && getCity->publish->GetTopic().HasLabel("cityId"), "Publish trait bound");
        Expect(getCity && !getCity->subscribe,                                      "Absent trait stays empty");
        Expect(getCity && getCity->location.line >= 4 && getCity->location.line <= 5, "Operation location");

        const OperationBinding* createCity = manifest.GetOperation("CreateCity");
        Expect(createCity && createCity->http && createCity->http->GetCode() == 201, "Explicit HTTP code");

        const OperationBinding* watch = manifest.GetOperation("WatchAlerts");
        Expect(watch && watch->subscribe && watch->subscribe->GetTopic().HasWildcards(), "Subscribe trait bound");
    }

    // === Invalid traits become located diagnostics ===
    {
        const char* doc =
            "[[operation]]\n"
            "name = \"Broken\"\n"
            "endpoint = { host_prefix = \"foo-{baz}{bar}\" }\n"
            "mqtt_publish = \"a/+/b\"\n"
            "http = { method = \"GET\", uri = \"/a/{b+}/{c}\" }\n";

        Manifest manifest = Manifest::LoadString(doc, "broken.toml", defaults);

        Expect(!manifest.IsValid() && manifest.ErrorCount() == 3, "Three trait errors");

        const Diagnostic* adjacent = FindByKind(manifest, PatternErrorKind::ADJACENT_LABELS);
        Expect(adjacent && adjacent->location.line == 3 && adjacent->location.column > 1
               && adjacent->operation == "Broken" && adjacent->traitId == "smithy.api#endpoint",
               "Host prefix error located on its line");

        const Diagnostic* wildcard = FindByKind(manifest, PatternErrorKind::ILLEGAL_WILDCARD);
        Expect(wildcard && wildcard->location.line == 4 && wildcard->traitId == "smithy.mqtt#publish",
               "Publish topic error located on its line");

        const Diagnostic* greedy = FindByKind(manifest, PatternErrorKind::GREEDY_LABEL_NOT_LAST);
        Expect(greedy && greedy->location.line == 5, "URI error located on its line");

        const OperationBinding* op = manifest.GetOperation("Broken");
        Expect(op && !op->endpoint && !op->publish && !op->http, "Rejected traits are not bound");

        std::string formatted = adjacent ? FormatDiagnostic(*adjacent) : std::string{};
        Expect(formatted.rfind("broken.toml:3:", 0) == 0
               && formatted.find(": error: [Broken] smithy.api#endpoint: Host labels must not be adjacent")
                  != std::string::npos,
               "Formatted diagnostic");
    }

    // === Document level problems ===
    {
        Manifest empty = Manifest::LoadString("[service]\nname = \"Nothing\"\n", "empty.toml", defaults);
        Expect(empty.IsValid() && empty.WarningCount() == 1, "Missing operations is a warning");

        Manifest malformed = Manifest::LoadString("[[operation]\nname = ", "bad.toml", defaults);
        Expect(!malformed.IsValid() && malformed.ErrorCount() == 1
               && malformed.GetDiagnostics()[0].location.line == 1, "TOML syntax error reported");

        const char* doc =
            "[[operation]]\n"
            "http = { method = \"GET\", uri = \"/a\" }\n"
            "[[operation]]\n"
            "name = \"Bad-Name\"\n"
            "[[operation]]\n"
            "name = \"Twice\"\n"
            "[[operation]]\n"
            "name = \"Twice\"\n"
            "[[operation]]\n"
            "name = \"Typed\"\n"
            "mqtt_publish = 5\n"
            "colour = \"blue\"\n";

        Manifest manifest = Manifest::LoadString(doc, "ops.toml", defaults);

        Expect(FindByMessage(manifest, "missing a `name`") != nullptr,      "Missing name");
        Expect(FindByMessage(manifest, "^[a-zA-Z0-9_]+$") != nullptr,        "Invalid operation name");
        Expect(FindByMessage(manifest, "defined more than once") != nullptr, "Duplicate operation");
        Expect(FindByMessage(manifest, "Expected a string value, found an integer") != nullptr,
               "Wrong value type");

        const Diagnostic* unknown = FindByMessage(manifest, "Unknown operation key `colour`");
        Expect(unknown && unknown->severity == Severity::WARNING, "Unknown key is a warning");

        Expect(manifest.ErrorCount() == 4 && manifest.WarningCount() == 1, "Diagnostic counts");
        Expect(manifest.GetOperations().size() == 2,                       "Good operations still load");
    }
}

static void RunConflictTests()
{
    const char* doc =
        "[[operation]]\n"
        "name = \"A\"\n"
        "http = { method = \"GET\", uri = \"/things/{id}\" }\n"
        "mqtt_publish = \"things/{id}\"\n"
        "[[operation]]\n"
        "name = \"B\"\n"
        "http = { method = \"GET\", uri = \"/things/{name}\" }\n"
        "[[operation]]\n"
        "name = \"C\"\n"
        "http = { method = \"POST\", uri = \"/things/{name}\" }\n"
        "mqtt_publish = \"things/{other}\"\n";

    CheckConfig asErrors;
    Manifest strict = Manifest::LoadString(doc, "conflicts.toml", asErrors);

    Expect(strict.ErrorCount() == 2, "HTTP and topic conflicts reported as errors");

    const Diagnostic* http = FindByMessage(strict, "conflicts with operation `A`");
    Expect(http && http->operation == "B" && http->location.line >= 5 && http->location.line <= 7,
           "HTTP conflict names both operations");

    const Diagnostic* topic = FindByMessage(strict, "conflicts with the topic of operation `A`");
    Expect(topic && topic->operation == "C", "Topic conflict names both operations");

    CheckConfig asWarnings;
    asWarnings.conflictsAsErrors = false;
    Manifest lenient = Manifest::LoadString(doc, "conflicts.toml", asWarnings);
    Expect(lenient.IsValid() && lenient.WarningCount() == 2, "Conflicts downgraded to warnings");

    CheckConfig silent;
    silent.reportConflicts = false;
    Manifest quiet = Manifest::LoadString(doc, "conflicts.toml", silent);
    Expect(quiet.GetDiagnostics().empty(), "Conflict reporting disabled");
}

static void RunConfigTests()
{
    Config& config = Config::GetInstance();
    config.Reset();

    Expect(config.loggingConfig.level == "info" && !config.loggingConfig.timestamps
           && config.checkConfig.reportConflicts && config.checkConfig.conflictsAsErrors
           && config.checkConfig.maxDiagnostics == 100, "Config defaults");

    const char* doc =
        "[Logging]\n"
        "level = \"debug\"\n"
        "timestamps = true\n"
        "[Check]\n"
        "conflicts_as_errors = false\n"
        "max_diagnostics = 5\n";

    Expect(config.LoadSettingsFromString(doc), "Config document parses");
    Expect(config.loggingConfig.level == "debug" && config.loggingConfig.timestamps, "Logging section read");
    Expect(!config.checkConfig.conflictsAsErrors && config.checkConfig.reportConflicts
           && config.checkConfig.maxDiagnostics == 5, "Check section read, missing keys keep defaults");

    config.Reset();
    Expect(config.LoadSettingsFromString("[Check]\nmax_diagnostics = -3\n")
           && config.checkConfig.maxDiagnostics == 0, "Negative max_diagnostics clamped");

    config.Reset();
    Expect(config.LoadSettingsFromString("[Check]\nreport_conflicts = \"yes\"\n")
           && config.checkConfig.reportConflicts, "Wrongly typed value keeps default");

    config.Reset();
    Expect(!config.LoadSettingsFromString("[Check\n"), "Malformed config rejected");

    config.Reset();
    config.LoadSettings("this/file/does/not/exist.toml");
    Expect(config.checkConfig.maxDiagnostics == 100, "Missing config file keeps defaults");

    // === Log level names ===
    Logger::Level level = Logger::Level::INFO;
    Expect(Logger::LevelFromName("WARNING", level) && level == Logger::Level::WARN, "Level names ignore case");
    Expect(!Logger::LevelFromName("loud", level), "Unknown level name rejected");
    Expect(Logger::MaskFromLevel(Logger::Level::ERR) == (Logger::ERROR_MASK | Logger::FATAL_MASK),
           "Mask keeps the level and everything above");
    Expect(Logger::MaskFromLevel(Logger::Level::NONE) == Logger::NONE_MASK, "'none' silences everything");
}

void RunManifestTests()
{
    RunManifestLoadingTests();
    RunConflictTests();
    RunConfigTests();

    if(failures > 0) {
        std::cerr << "[Manifest Test] " << failures << " test(s) FAILED!\n";
        std::exit(1);
    }

    std::cout << "[Manifest Test] All tests passed.\n";
}

int main()
{
    RunManifestTests();
    return 0;
}
