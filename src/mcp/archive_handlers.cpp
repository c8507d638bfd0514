#include <archive_mcp/mcp/archive_handlers.hpp>

#include <archive_mcp/core/log.hpp>
#include <archive_mcp/mcp/mcp_types.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace archive_mcp {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const nlohmann::json& data) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", DumpWire(data, 2)}}})};
}

// Data-level failures are reported inside a normal result.
ToolResult MakeDataError(const std::string& message) {
    return MakeOkResult({{"error", message}});
}

std::string RequireString(const nlohmann::json& params, const std::string& key) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        throw std::invalid_argument("Missing required parameter: " + key);
    }
    return params[key].get<std::string>();
}

// Values beyond the int range saturate instead of wrapping.
int OptInt(const nlohmann::json& params, const std::string& key, int default_val) {
    if (!params.contains(key) || !params[key].is_number_integer()) {
        return default_val;
    }
    const auto& value = params[key];
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                   ? std::numeric_limits<int>::max()
                   : static_cast<int>(u);
    }
    const auto v = value.get<std::int64_t>();
    return static_cast<int>(std::clamp<std::int64_t>(
        v, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, int default_val) {
    return {{"type", "integer"}, {"description", desc}, {"default", default_val}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Shared steps
// ---------------------------------------------------------------------------

std::string ReadFailureMessage(const Error& error) {
    if (error.category == ErrorCategory::NotFound ||
        error.category == ErrorCategory::InvalidArgument) {
        return error.message;
    }
    return "Error reading document: " + error.ToString();
}

// Read and (re)index one document. Returns the record or a data error message.
Result<DocumentRecord, std::string> LoadDocument(const ArchiveDirectory& archive,
                                                 DocumentIndex& index,
                                                 const std::string& filename) {
    using R = Result<DocumentRecord, std::string>;

    auto content = archive.Read(filename);
    if (content.IsErr()) {
        LogDebug("tools", content.Error().ToString());
        return R::Err(ReadFailureMessage(content.Error()));
    }

    auto path = (std::filesystem::path(archive.Root()) / filename).string();
    const auto size = content.Value().size();
    return R::Ok(index.Process(filename, content.Value(),
                               {{"path", path}, {"size_bytes", size}}));
}

// Index every archive document the index has not seen yet.
void IndexPending(const ArchiveDirectory& archive, DocumentIndex& index) {
    auto entries = archive.Scan();
    if (entries.IsErr()) {
        LogWarn("tools", entries.Error().ToString());
        return;
    }
    for (const auto& entry : entries.Value()) {
        if (index.Contains(entry.filename)) continue;
        auto content = archive.Read(entry.filename);
        if (content.IsErr()) {
            LogWarn("tools", content.Error().ToString());
            continue;
        }
        index.Process(entry.filename, content.Value(),
                      {{"path", entry.path}, {"size_bytes", entry.size_bytes}});
    }
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// list_documents
ToolResult HandleListDocuments(const ArchiveDirectory& archive) {
    auto entries = archive.Scan();
    if (entries.IsErr()) return MakeDataError(entries.Error().message);

    auto j = nlohmann::json::array();
    for (const auto& e : entries.Value()) {
        j.push_back({{"filename", e.filename}, {"path", e.path}});
    }
    return MakeOkResult(j);
}

// get_document
ToolResult HandleGetDocument(const ArchiveDirectory& archive, DocumentIndex& index,
                             const nlohmann::json& params) {
    auto filename = RequireString(params, "filename");
    auto record = LoadDocument(archive, index, filename);
    if (record.IsErr()) return MakeDataError(record.Error());

    const auto& r = record.Value();
    return MakeOkResult({
        {"filename", r.id},
        {"summary", r.summary},
        {"word_count", r.word_count},
        {"char_count", r.char_count},
        {"metadata", r.metadata},
        {"has_embedding", r.embedding.has_value()},
    });
}

// search_documents
ToolResult HandleSearchDocuments(const ArchiveDirectory& archive, DocumentIndex& index,
                                 int default_top_k, const nlohmann::json& params) {
    auto query = RequireString(params, "query");
    auto top_k = OptInt(params, "top_k", default_top_k);

    if (top_k < 0) {
        return MakeDataError("top_k must be non-negative, got " + std::to_string(top_k));
    }
    if (!index.EmbeddingsAvailable()) {
        return MakeDataError("Semantic search unavailable: embeddings are disabled");
    }

    IndexPending(archive, index);

    auto hits = index.SearchSimilar(query, top_k);
    if (hits.IsErr()) return MakeDataError(hits.Error().message);

    auto j = nlohmann::json::array();
    for (const auto& hit : hits.Value()) {
        j.push_back({
            {"filename", hit.id},
            {"summary", hit.summary},
            {"similarity", hit.similarity},
        });
    }
    return MakeOkResult(j);
}

// summarize_document
ToolResult HandleSummarizeDocument(const ArchiveDirectory& archive, DocumentIndex& index,
                                   const nlohmann::json& params) {
    auto filename = RequireString(params, "filename");
    auto record = LoadDocument(archive, index, filename);
    if (record.IsErr()) return MakeDataError(record.Error());

    return MakeOkResult({
        {"filename", record.Value().id},
        {"summary", record.Value().summary},
        {"word_count", record.Value().word_count},
    });
}

// ---------------------------------------------------------------------------
// Resource handlers
// ---------------------------------------------------------------------------

std::string RenderIndex(const ArchiveDirectory& archive) {
    auto entries = archive.Scan();
    if (entries.IsErr()) {
        throw std::runtime_error(entries.Error().ToString());
    }

    std::ostringstream out;
    out << "Archive documents in " << archive.Root() << "\n\n";
    std::uintmax_t total = 0;
    for (const auto& e : entries.Value()) {
        out << "- " << e.filename << " (" << e.size_bytes << " bytes)\n";
        total += e.size_bytes;
    }
    out << "\nTotal: " << entries.Value().size() << " documents, "
        << total << " bytes\n";
    return out.str();
}

std::string MimeTypeFor(const std::string& filename) {
    auto ext = std::filesystem::path(filename).extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".md") return "text/markdown";
    return "text/plain";
}

} // anonymous namespace

void RegisterArchiveTools(ToolRegistry& registry,
                          const ArchiveDirectory& archive,
                          DocumentIndex& index,
                          int default_top_k) {
    registry.Register(
        "list_documents",
        "List every document in the archive.",
        MakeSchema(nlohmann::json::object(), nlohmann::json::array()),
        [&archive](const nlohmann::json&) { return HandleListDocuments(archive); });

    registry.Register(
        "get_document",
        "Read a document, index it, and return its summary, counts and metadata.",
        MakeSchema({{"filename", StringProp("Document filename, e.g. intro.md")}},
                   nlohmann::json::array({"filename"})),
        [&archive, &index](const nlohmann::json& params) {
            return HandleGetDocument(archive, index, params);
        });

    registry.Register(
        "search_documents",
        "Semantic search over the archive; returns the most similar documents.",
        MakeSchema({{"query", StringProp("Free-text query")},
                    {"top_k", IntProp("Maximum number of results", default_top_k)}},
                   nlohmann::json::array({"query"})),
        [&archive, &index, default_top_k](const nlohmann::json& params) {
            return HandleSearchDocuments(archive, index, default_top_k, params);
        });

    registry.Register(
        "summarize_document",
        "Return the summary and word count of a document.",
        MakeSchema({{"filename", StringProp("Document filename, e.g. intro.md")}},
                   nlohmann::json::array({"filename"})),
        [&archive, &index](const nlohmann::json& params) {
            return HandleSummarizeDocument(archive, index, params);
        });
}

void RegisterArchiveResources(ResourceRegistry& registry,
                              const ArchiveDirectory& archive) {
    registry.Register(
        kIndexResourceUri, "Archive Index",
        "Complete index of all archive documents",
        [&archive] { return RenderIndex(archive); });

    auto entries = archive.Scan();
    if (entries.IsErr()) {
        LogWarn("resources", entries.Error().ToString());
        return;
    }
    for (const auto& e : entries.Value()) {
        const auto filename = e.filename;
        registry.Register(
            kDocumentResourcePrefix + filename, "Document: " + filename,
            "Content of " + filename + " from the archive",
            [&archive, filename] {
                auto content = archive.Read(filename);
                if (content.IsErr()) {
                    throw std::runtime_error(content.Error().ToString());
                }
                return std::move(content).Value();
            },
            MimeTypeFor(filename));
    }
    LogDebug("resources", "Registered " + std::to_string(entries.Value().size()) +
                              " document resources");
}

void RegisterArchiveContext(ContextAggregator& context,
                            const ArchiveDirectory& archive,
                            const DocumentIndex& index,
                            const std::string& archive_title) {
    context.Register([&archive, &index, archive_title](const nlohmann::json&) {
        auto entries = archive.Scan();
        const std::size_t count = entries.ValueOr({}).size();
        return nlohmann::json{
            {"archive_name", archive_title},
            {"document_count", count},
            {"documents_directory", archive.Root()},
            {"available_extensions", archive.Extensions()},
            {"indexed_documents", index.Size()},
            {"embeddings_enabled", index.EmbeddingsAvailable()},
            {"status", entries.IsOk() ? "operational" : "degraded"},
        };
    });
}

} // namespace archive_mcp
