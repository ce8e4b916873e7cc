#ifndef IDLX_CONFIG_HPP
#define IDLX_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace IDLX::Core {

struct LoggingConfig {
    std::string level      = "info";
    bool        timestamps = false;
};

struct CheckConfig {
    bool         reportConflicts   = true;
    bool         conflictsAsErrors = true;
    std::int64_t maxDiagnostics    = 100; // 0 = unlimited
};

class Config {
public:
    static Config& GetInstance();

    // Missing file keeps the defaults, a malformed one is fatal
    void LoadSettings(std::string_view path);

    // Same as above but for in-memory documents, returns false on parse errors
    bool LoadSettingsFromString(std::string_view document, std::string_view sourceName = "idlx.toml");

    // Pushes [Logging] into the Logger
    void ApplyLoggingSettings() const;

    // Back to defaults
    void Reset();

public:
    LoggingConfig loggingConfig;
    CheckConfig   checkConfig;

private:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;
};

} // namespace IDLX::Core

#endif // IDLX_CONFIG_HPP
