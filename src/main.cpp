#include <archive_mcp/archive/archive_directory.hpp>
#include <archive_mcp/config/config_loader.hpp>
#include <archive_mcp/core/ansi.hpp>
#include <archive_mcp/core/log.hpp>
#include <archive_mcp/core/terminal.hpp>
#include <archive_mcp/core/version.hpp>
#include <archive_mcp/index/document_index.hpp>
#include <archive_mcp/index/embedding_provider.hpp>
#include <archive_mcp/mcp/archive_handlers.hpp>
#include <archive_mcp/mcp/http_transport.hpp>
#include <archive_mcp/mcp/mcp_server.hpp>
#include <archive_mcp/mcp/stdio_transport.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitRuntime = 1;
constexpr int kExitConfig = 2;

// Errors before the logger exists go straight to stderr; stdout belongs to
// the stdio transport.
void PrintError(const archive_mcp::Error& error) {
    using namespace archive_mcp;
    if (UseColorForStderr()) {
        std::cerr << ansi::kRed << "error" << ansi::kReset << ": "
                  << error.ToString() << "\n";
    } else {
        std::cerr << "error: " << error.ToString() << "\n";
    }
}

archive_mcp::Result<archive_mcp::AppConfig, archive_mcp::Error> ResolveConfig(
    const archive_mcp::CliOptions& cli) {
    using namespace archive_mcp;
    using R = Result<AppConfig, Error>;

    AppConfig config;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return R::Err(std::move(yaml).Error());
        }
        config = std::move(yaml).Value();
    }

    auto with_env = ApplyEnvOverrides(std::move(config));
    if (with_env.IsErr()) {
        return with_env;
    }
    config = ApplyCliOverrides(std::move(with_env).Value(), cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return R::Ok(std::move(config));
}

void InitLogging(const archive_mcp::AppConfig& config) {
    using namespace archive_mcp;

    auto level = LogLevel::Warn;
    if (config.verbose) {
        level = LogLevel::Info;
    } else if (config.quiet) {
        level = LogLevel::Error;
    }

    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sink = std::move(file);
        } else {
            std::cerr << "warning: cannot open log file " << *config.log_file
                      << ", logging to stderr\n";
        }
    }
    if (!sink && config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    }
    if (!sink) {
        sink = std::make_unique<ColorConsoleSink>(UseColorForStderr());
    }
    InitGlobalLogger(std::move(sink), level);
}

int RunServer(const archive_mcp::AppConfig& config) {
    using namespace archive_mcp;

    ArchiveDirectory archive(config.archive.documents_dir, config.archive.extensions);

    DocumentIndexOptions index_opts;
    index_opts.summary_max_length = config.index.summary_max_length;
    index_opts.use_embeddings = config.index.use_embeddings;
    DocumentIndex index(
        std::make_unique<HashEmbeddingProvider>(config.index.embedding_dim), index_opts);

    McpServer server(ServerInfo{config.server.name, kVersion});
    RegisterArchiveTools(server.Tools(), archive, index, config.index.default_top_k);
    RegisterArchiveResources(server.Resources(), archive);
    RegisterArchiveContext(server.Context(), archive, index, config.archive.title);

    LogInfo("main", config.server.name + " " + kVersion + ": " +
                        std::to_string(server.Tools().Size()) + " tools, " +
                        std::to_string(server.Resources().Size()) + " resources, " +
                        "documents in " + archive.Root());

    if (config.server.transport == TransportKind::Http) {
        HttpTransport http(server);
        if (!http.Listen(config.server.host, config.server.port)) {
            return kExitRuntime;
        }
        return kExitSuccess;
    }

    StdioTransport stdio(server);
    stdio.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace archive_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error());
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << "archive-mcp " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config = ResolveConfig(cli.Value());
    if (config.IsErr()) {
        PrintError(config.Error());
        return kExitConfig;
    }

    InitLogging(config.Value());
    return RunServer(config.Value());
}
