#include "manifest.hpp"

#include "utils/logger/logger.hpp"
#include "utils/string/string.hpp"

#include <toml++/toml.hpp>

namespace IDLX::Core {

using namespace IDLX::Utils; // For 'Logger', 'IsLabelName'
using Model::PatternError;
using Model::PatternErrorKind;
using Model::PatternResult;

const char* SeverityToString(Severity severity)
{
    return severity == Severity::ERR ? "error" : "warning";
}

std::string FormatDiagnostic(const Diagnostic& diagnostic)
{
    std::string out = diagnostic.location.file
                    + ":" + std::to_string(diagnostic.location.line)
                    + ":" + std::to_string(diagnostic.location.column)
                    + ": " + SeverityToString(diagnostic.severity) + ": ";

    if(!diagnostic.operation.empty())
        out += "[" + diagnostic.operation + "] ";

    if(!diagnostic.traitId.empty())
        out += diagnostic.traitId + ": ";

    return out + diagnostic.message;
}

// Walks the parsed document and fills a Manifest, one diagnostic per problem
class ManifestLoader {
public:
    ManifestLoader(Manifest& manifest, std::string_view sourceName, const CheckConfig& settings)
        : manifest_(manifest), sourceName_(sourceName), settings_(settings)
    {}

    void LoadTable(const toml::table& root);
    void AddParseError(const toml::parse_error& err);

private:
    SourceLocation LocationOf(const toml::node& node) const;

    void AddDiagnostic(
        Severity severity, SourceLocation location, std::string_view operation,
        std::string_view traitId, std::string message,
        std::optional<PatternErrorKind> kind = std::nullopt
    );

    void LoadOperation(const toml::table& opTable);
    void LoadHttpTrait(const toml::node& node, OperationBinding& op);
    void LoadEndpointTrait(const toml::node& node, OperationBinding& op);
    void CheckConflicts();

    std::optional<std::string> ExpectString(const toml::node& node, std::string_view op, std::string_view traitId);

    // Stores a successfully built trait or turns the failure into a diagnostic
    template<typename TraitT>
    void AssignTrait(
        PatternResult<TraitT> result, std::optional<TraitT>& slot,
        const toml::node& node, const OperationBinding& op, std::string_view traitId
    )
    {
        if(auto* error = std::get_if<PatternError>(&result)) {
            AddDiagnostic(
                Severity::ERR, LocationOf(node), op.name, traitId,
                std::move(error->message), error->kind
            );
            return;
        }

        slot.emplace(std::move(std::get<TraitT>(result)));
    }

private:
    Manifest&          manifest_;
    std::string        sourceName_;
    const CheckConfig& settings_;
};

static const char* NodeTypeName(toml::node_type type)
{
    switch(type) {
        case toml::node_type::table:          return "a table";
        case toml::node_type::array:          return "an array";
        case toml::node_type::string:         return "a string";
        case toml::node_type::integer:        return "an integer";
        case toml::node_type::floating_point: return "a float";
        case toml::node_type::boolean:        return "a boolean";
        case toml::node_type::date:           return "a date";
        case toml::node_type::time:           return "a time";
        case toml::node_type::date_time:      return "a date-time";
        default:                              return "nothing";
    }
}

SourceLocation ManifestLoader::LocationOf(const toml::node& node) const
{
    const auto& region = node.source();
    return SourceLocation{ sourceName_, region.begin.line, region.begin.column };
}

void ManifestLoader::AddDiagnostic(
    Severity severity, SourceLocation location, std::string_view operation,
    std::string_view traitId, std::string message, std::optional<PatternErrorKind> kind
)
{
    Diagnostic diagnostic;
    diagnostic.severity         = severity;
    diagnostic.location         = std::move(location);
    diagnostic.operation        = std::string{operation};
    diagnostic.traitId          = std::string{traitId};
    diagnostic.message          = std::move(message);
    diagnostic.patternErrorKind = kind;

    Logger::GetInstance().Debug("[Manifest]: ", FormatDiagnostic(diagnostic));
    manifest_.diagnostics_.push_back(std::move(diagnostic));
}

void ManifestLoader::AddParseError(const toml::parse_error& err)
{
    const auto& region = err.source();
    AddDiagnostic(
        Severity::ERR, SourceLocation{ sourceName_, region.begin.line, region.begin.column },
        {}, {}, std::string{err.description()}
    );
}

std::optional<std::string> ManifestLoader::ExpectString(
    const toml::node& node, std::string_view op, std::string_view traitId
)
{
    if(node.is_string())
        return node.value<std::string>();

    AddDiagnostic(
        Severity::ERR, LocationOf(node), op, traitId,
        std::string{"Expected a string value, found "} + NodeTypeName(node.type())
    );
    return std::nullopt;
}

void ManifestLoader::LoadTable(const toml::table& root)
{
    if(auto service = root["service"]["name"].value<std::string>())
        manifest_.serviceName_ = std::move(*service);

    const toml::node* operations = root.get("operation");
    if(!operations) {
        AddDiagnostic(
            Severity::WARNING, SourceLocation{ sourceName_, 1, 1 }, {}, {},
            "Manifest does not declare any [[operation]]"
        );
        return;
    }

    const toml::array* opArray = operations->as_array();
    if(!opArray) {
        AddDiagnostic(
            Severity::ERR, LocationOf(*operations), {}, {},
            "`operation` must be an array of tables ([[operation]])"
        );
        return;
    }

    for(const toml::node& element : *opArray) {
        if(const toml::table* opTable = element.as_table())
            LoadOperation(*opTable);
        else
            AddDiagnostic(Severity::ERR, LocationOf(element), {}, {}, "Every `operation` entry must be a table");
    }

    if(settings_.reportConflicts)
        CheckConflicts();

    Logger::GetInstance().Debug(
        "[Manifest]: '", sourceName_, "' loaded ", manifest_.operations_.size(), " operation(s), ",
        manifest_.diagnostics_.size(), " diagnostic(s)"
    );
}

void ManifestLoader::LoadOperation(const toml::table& opTable)
{
    OperationBinding op;
    op.location = LocationOf(opTable);

    const toml::node* nameNode = opTable.get("name");
    if(!nameNode) {
        AddDiagnostic(Severity::ERR, op.location, {}, {}, "Operation is missing a `name`");
        return;
    }

    auto name = ExpectString(*nameNode, {}, {});
    if(!name)
        return;

    if(name->empty() || !IsLabelName(*name)) {
        AddDiagnostic(
            Severity::ERR, LocationOf(*nameNode), {}, {},
            "Operation names must match ^[a-zA-Z0-9_]+$. Found `" + *name + "`"
        );
        return;
    }

    if(manifest_.GetOperation(*name)) {
        AddDiagnostic(
            Severity::ERR, LocationOf(*nameNode), *name, {},
            "Operation `" + *name + "` is defined more than once"
        );
        return;
    }

    op.name = *name;

    for(auto&& [key, node] : opTable) {
        std::string_view k = key.str();

        if(k == "name")
            continue;

        else if(k == "http")
            LoadHttpTrait(node, op);

        else if(k == "endpoint")
            LoadEndpointTrait(node, op);

        else if(k == "mqtt_publish") {
            if(auto topic = ExpectString(node, op.name, Mqtt::PublishTrait::TRAIT_ID))
                AssignTrait(Mqtt::PublishTrait::Create(*topic), op.publish, node, op, Mqtt::PublishTrait::TRAIT_ID);
        }

        else if(k == "mqtt_subscribe") {
            if(auto topic = ExpectString(node, op.name, Mqtt::SubscribeTrait::TRAIT_ID))
                AssignTrait(Mqtt::SubscribeTrait::Create(*topic), op.subscribe, node, op, Mqtt::SubscribeTrait::TRAIT_ID);
        }

        else
            AddDiagnostic(
                Severity::WARNING, LocationOf(node), op.name, {},
                "Unknown operation key `" + std::string{k} + "` ignored"
            );
    }

    manifest_.operations_.push_back(std::move(op));
}

void ManifestLoader::LoadHttpTrait(const toml::node& node, OperationBinding& op)
{
    const char* traitId = Http::HttpTrait::TRAIT_ID;

    const toml::table* http = node.as_table();
    if(!http) {
        AddDiagnostic(Severity::ERR, LocationOf(node), op.name, traitId, "`http` must be a table");
        return;
    }

    auto method = (*http)["method"].value<std::string>();
    auto uri    = (*http)["uri"].value<std::string>();

    if(!method || !uri) {
        AddDiagnostic(
            Severity::ERR, LocationOf(node), op.name, traitId,
            "`http` requires string members `method` and `uri`"
        );
        return;
    }

    std::int64_t code = Http::HttpTrait::DEFAULT_CODE;
    if(const toml::node* codeNode = http->get("code")) {
        auto value = codeNode->value<std::int64_t>();
        if(!value) {
            AddDiagnostic(Severity::ERR, LocationOf(*codeNode), op.name, traitId, "`code` must be an integer");
            return;
        }
        code = *value;
    }

    // Point at the uri itself, that's what most failures are about
    const toml::node& uriNode = *http->get("uri");
    AssignTrait(Http::HttpTrait::Create(*method, *uri, code), op.http, uriNode, op, traitId);
}

void ManifestLoader::LoadEndpointTrait(const toml::node& node, OperationBinding& op)
{
    const char* traitId = Model::EndpointTrait::TRAIT_ID;

    const toml::table* endpoint = node.as_table();
    const toml::node*  prefix   = endpoint ? endpoint->get("host_prefix") : nullptr;

    if(!prefix) {
        AddDiagnostic(
            Severity::ERR, LocationOf(node), op.name, traitId,
            "`endpoint` must be a table with a `host_prefix` member"
        );
        return;
    }

    if(auto hostPrefix = ExpectString(*prefix, op.name, traitId))
        AssignTrait(Model::EndpointTrait::Create(*hostPrefix), op.endpoint, *prefix, op, traitId);
}

void ManifestLoader::CheckConflicts()
{
    const auto&    ops      = manifest_.operations_;
    const Severity severity = settings_.conflictsAsErrors ? Severity::ERR : Severity::WARNING;

    for(std::size_t i = 0; i < ops.size(); ++i) {
        for(std::size_t j = i + 1; j < ops.size(); ++j) {
            const OperationBinding& first  = ops[i];
            const OperationBinding& second = ops[j];

            if(first.http && second.http
               && first.http->GetMethod() == second.http->GetMethod()
               && first.http->GetUri().ConflictsWith(second.http->GetUri()))
                AddDiagnostic(
                    severity, second.location, second.name, Http::HttpTrait::TRAIT_ID,
                    "`" + second.http->GetMethod() + " " + second.http->GetUri().ToString()
                    + "` conflicts with operation `" + first.name + "` (`" + first.http->GetMethod()
                    + " " + first.http->GetUri().ToString() + "`)"
                );

            if(first.publish && second.publish
               && first.publish->GetTopic().ConflictsWith(second.publish->GetTopic()))
                AddDiagnostic(
                    severity, second.location, second.name, Mqtt::PublishTrait::TRAIT_ID,
                    "Topic `" + second.publish->GetValue() + "` conflicts with the topic of operation `"
                    + first.name + "` (`" + first.publish->GetValue() + "`)"
                );
        }
    }
}

// vvv Manifest vvv
Manifest Manifest::LoadFile(std::string_view path, const CheckConfig& settings)
{
    Manifest       manifest;
    ManifestLoader loader(manifest, path, settings);

    try {
        auto tbl = toml::parse_file(path);
        loader.LoadTable(tbl);
    }
    catch(const toml::parse_error& err) {
        loader.AddParseError(err);
    }

    return manifest;
}

Manifest Manifest::LoadString(std::string_view document, std::string_view sourceName, const CheckConfig& settings)
{
    Manifest       manifest;
    ManifestLoader loader(manifest, sourceName, settings);

    try {
        auto tbl = toml::parse(document, sourceName);
        loader.LoadTable(tbl);
    }
    catch(const toml::parse_error& err) {
        loader.AddParseError(err);
    }

    return manifest;
}

// vvv Accessors vvv
const std::string& Manifest::GetServiceName() const
{
    return serviceName_;
}

const std::vector<OperationBinding>& Manifest::GetOperations() const
{
    return operations_;
}

const OperationBinding* Manifest::GetOperation(std::string_view name) const
{
    for(const auto& op : operations_)
        if(op.name == name)
            return &op;

    return nullptr;
}

const std::vector<Diagnostic>& Manifest::GetDiagnostics() const
{
    return diagnostics_;
}

std::size_t Manifest::ErrorCount() const
{
    std::size_t count = 0;
    for(const auto& diagnostic : diagnostics_)
        if(diagnostic.severity == Severity::ERR)
            ++count;

    return count;
}

std::size_t Manifest::WarningCount() const
{
    return diagnostics_.size() - ErrorCount();
}

bool Manifest::IsValid() const
{
    return ErrorCount() == 0;
}

} // namespace IDLX::Core
