#include <archive_mcp/config/config_loader.hpp>

#include <archive_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace archive_mcp {

namespace {

Error MakeConfigError(const std::string& message,
                      std::optional<std::string> path = std::nullopt) {
    return Error{"ConfigLoader", message, ErrorCategory::Config, std::move(path)};
}

std::optional<int> ParsePort(const std::string& text) {
    try {
        std::size_t consumed = 0;
        auto value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // anonymous namespace

const char* TransportName(TransportKind kind) noexcept {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http:  return "http";
    }
    return "stdio";
}

std::optional<TransportKind> TransportFromName(std::string_view name) {
    if (name == "stdio") return TransportKind::Stdio;
    if (name == "http") return TransportKind::Http;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string path(file_path);
    AppConfig config;

    try {
        auto root = YAML::LoadFile(path);

        // -- Server --
        if (const auto server = root["server"]) {
            if (server["name"]) {
                config.server.name = server["name"].as<std::string>();
            }
            if (server["host"]) {
                config.server.host = server["host"].as<std::string>();
            }
            if (server["port"]) {
                config.server.port = server["port"].as<int>();
            }
            if (server["transport"]) {
                auto name = server["transport"].as<std::string>();
                auto kind = TransportFromName(name);
                if (!kind) {
                    return Result<AppConfig, Error>::Err(
                        MakeConfigError("Unknown transport: " + name, path));
                }
                config.server.transport = *kind;
            }
        }

        // -- Archive --
        if (const auto archive = root["archive"]) {
            if (archive["title"]) {
                config.archive.title = archive["title"].as<std::string>();
            }
            if (archive["documents_dir"]) {
                config.archive.documents_dir = archive["documents_dir"].as<std::string>();
            }
            if (archive["extensions"]) {
                config.archive.extensions =
                    archive["extensions"].as<std::vector<std::string>>();
            }
        }

        // -- Index --
        if (const auto index = root["index"]) {
            if (index["use_embeddings"]) {
                config.index.use_embeddings = index["use_embeddings"].as<bool>();
            }
            if (index["embedding_dim"]) {
                config.index.embedding_dim = index["embedding_dim"].as<std::size_t>();
            }
            if (index["summary_max_length"]) {
                config.index.summary_max_length =
                    index["summary_max_length"].as<std::size_t>();
            }
            if (index["default_top_k"]) {
                config.index.default_top_k = index["default_top_k"].as<int>();
            }
        }

        // -- Options --
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()), path));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("archive-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Bind address for the HTTP transport");
    program.add_argument("--port")
        .help("Port for the HTTP transport")
        .scan<'i', int>();
    program.add_argument("--transport")
        .help("stdio or http");
    program.add_argument("--documents-dir")
        .help("Directory holding the archive documents");
    program.add_argument("--no-embeddings")
        .help("Disable embeddings and semantic search")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--json-logs")
        .help("Structured JSON logs on stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.host = program.present("--host");
    cli.port = program.present<int>("--port");
    if (auto val = program.present("--transport")) {
        cli.transport = TransportFromName(*val);
        if (!cli.transport) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --transport: " + *val +
                                " (expected stdio or http)"));
        }
    }
    cli.documents_dir = program.present("--documents-dir");
    cli.log_file = program.present("--log-file");
    cli.no_embeddings = program.get<bool>("--no-embeddings");
    cli.json_logs = program.get<bool>("--json-logs");
    cli.verbose = program.get<bool>("--verbose");
    cli.quiet = program.get<bool>("--quiet");
    cli.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyEnvOverrides
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvOverrides(AppConfig config) {
    if (const char* host = std::getenv("MCP_HOST")) {
        config.server.host = host;
    }
    if (const char* port = std::getenv("MCP_PORT")) {
        auto parsed = ParsePort(port);
        if (!parsed) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("MCP_PORT is not a number: " + std::string(port)));
        }
        config.server.port = *parsed;
    }
    if (const char* dir = std::getenv("ARCHIVE_DOCUMENTS_DIR")) {
        config.archive.documents_dir = dir;
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyCliOverrides
// ---------------------------------------------------------------------------
AppConfig ApplyCliOverrides(AppConfig config, const CliOptions& cli) {
    if (cli.host) {
        config.server.host = *cli.host;
    }
    if (cli.port) {
        config.server.port = *cli.port;
    }
    if (cli.transport) {
        config.server.transport = *cli.transport;
    }
    if (cli.documents_dir) {
        config.archive.documents_dir = *cli.documents_dir;
    }
    if (cli.log_file) {
        config.log_file = cli.log_file;
    }
    if (cli.no_embeddings) {
        config.index.use_embeddings = false;
    }
    if (cli.json_logs) {
        config.json_logs = true;
    }
    if (cli.verbose) {
        config.verbose = true;
    }
    if (cli.quiet) {
        config.quiet = true;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.name"));
    }
    if (config.server.transport == TransportKind::Http) {
        if (config.server.host.empty()) {
            return Result<void, Error>::Err(MakeConfigError("Missing required field: server.host"));
        }
        if (config.server.port <= 0 ||
            config.server.port > std::numeric_limits<std::uint16_t>::max()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid port: " + std::to_string(config.server.port)));
        }
    }
    if (config.archive.documents_dir.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: archive.documents_dir"));
    }
    if (config.archive.extensions.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("archive.extensions must list at least one extension"));
    }
    if (config.index.use_embeddings && config.index.embedding_dim == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("index.embedding_dim must be positive when embeddings are enabled"));
    }
    if (config.index.summary_max_length == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("index.summary_max_length must be positive"));
    }
    if (config.index.default_top_k < 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "index.default_top_k must be non-negative, got " +
            std::to_string(config.index.default_top_k)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("--verbose and --quiet are mutually exclusive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace archive_mcp
