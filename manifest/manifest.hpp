#ifndef IDLX_MANIFEST_HPP
#define IDLX_MANIFEST_HPP

#include "config/config.hpp"
#include "http/traits/http_trait.hpp"
#include "model/traits/endpoint_trait.hpp"
#include "mqtt/traits/publish_trait.hpp"
#include "mqtt/traits/subscribe_trait.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace IDLX::Core {

enum class Severity : std::uint8_t {
    WARNING,
    ERR
};

const char* SeverityToString(Severity severity);

struct SourceLocation {
    std::string   file;
    std::uint32_t line   = 0;
    std::uint32_t column = 0;
};

struct Diagnostic {
    Severity       severity = Severity::ERR;
    SourceLocation location;
    std::string    operation; // Empty for document level problems
    std::string    traitId;   // Empty when no trait is involved
    std::string    message;

    // Set when the diagnostic came out of the pattern engine
    std::optional<Model::PatternErrorKind> patternErrorKind;
};

// "file:line:column: severity: [operation] trait: message"
std::string FormatDiagnostic(const Diagnostic& diagnostic);

// Every trait an operation carries, each is optional
struct OperationBinding {
    std::string    name;
    SourceLocation location;

    std::optional<Http::HttpTrait>      http;
    std::optional<Model::EndpointTrait> endpoint;
    std::optional<Mqtt::PublishTrait>   publish;
    std::optional<Mqtt::SubscribeTrait> subscribe;
};

/*
 * A TOML document binding operations to HTTP, endpoint and MQTT traits:
 *
 *   [[operation]]
 *   name = "GetCity"
 *   http = { method = "GET", uri = "/cities/{cityId}" }
 *   endpoint = { host_prefix = "{region}." }
 *   mqtt_publish = "cities/{cityId}"
 *
 * Loading never stops at the first problem, every rejected trait becomes a
 * located Diagnostic and the operation simply goes without that trait.
 */
class Manifest {
public:
    static Manifest LoadFile(
        std::string_view path, const CheckConfig& settings = Config::GetInstance().checkConfig
    );
    static Manifest LoadString(
        std::string_view document, std::string_view sourceName,
        const CheckConfig& settings = Config::GetInstance().checkConfig
    );

    // vvv Accessors vvv
    const std::string&                   GetServiceName() const;
    const std::vector<OperationBinding>& GetOperations()  const;
    const OperationBinding*              GetOperation(std::string_view name) const;
    const std::vector<Diagnostic>&       GetDiagnostics() const;
    std::size_t                          ErrorCount()     const;
    std::size_t                          WarningCount()   const;
    bool                                 IsValid()        const; // No errors

private:
    Manifest() = default;

    friend class ManifestLoader;

private:
    std::string                   serviceName_;
    std::vector<OperationBinding> operations_;
    std::vector<Diagnostic>       diagnostics_;
};

} // namespace IDLX::Core

#endif // IDLX_MANIFEST_HPP
