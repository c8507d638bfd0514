#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archive_mcp {

enum class TransportKind {
    Stdio,
    Http,
};

[[nodiscard]] const char* TransportName(TransportKind kind) noexcept;
[[nodiscard]] std::optional<TransportKind> TransportFromName(std::string_view name);

struct ServerConfig {
    std::string name = "archive-mcp";
    std::string host = "0.0.0.0";
    int port = 8080;
    TransportKind transport = TransportKind::Stdio;
};

struct ArchiveConfig {
    std::string title = "Document Archive";
    std::string documents_dir = "documents";
    std::vector<std::string> extensions = {".html", ".md", ".txt"};
};

struct IndexConfig {
    bool use_embeddings = true;
    std::size_t embedding_dim = 384;
    std::size_t summary_max_length = 200;
    int default_top_k = 5;
};

struct AppConfig {
    ServerConfig server;
    ArchiveConfig archive;
    IndexConfig index;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace archive_mcp
