#pragma once

#include <archive_mcp/config/app_config.hpp>
#include <archive_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace archive_mcp {

// Command-line flags. Unset optionals leave the underlying config untouched.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<TransportKind> transport;
    std::optional<std::string> documents_dir;
    std::optional<std::string> log_file;
    bool no_embeddings = false;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
    bool show_version = false;
};

// Parse a YAML config file into an AppConfig. Keys that are absent keep
// their defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// MCP_HOST, MCP_PORT, ARCHIVE_DOCUMENTS_DIR.
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config);

AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli);

// Validate that values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace archive_mcp
