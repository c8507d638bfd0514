#pragma once

#include <archive_mcp/core/result.hpp>
#include <archive_mcp/index/embedding_provider.hpp>
#include <archive_mcp/index/summarizer.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace archive_mcp {

// ---------------------------------------------------------------------------
// DocumentRecord — the processed form of one archive document.
// ---------------------------------------------------------------------------
struct DocumentRecord {
    std::string id;
    std::string content;
    std::string summary;
    std::size_t word_count = 0;
    std::size_t char_count = 0;
    std::optional<Embedding> embedding;
    nlohmann::json metadata = nlohmann::json::object();
};

struct DocumentInput {
    std::string id;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

struct SearchHit {
    std::string id;
    std::string summary;
    double similarity = 0.0;
};

struct DocumentIndexOptions {
    std::size_t summary_max_length = kDefaultSummaryLength;
    bool use_embeddings = true;
};

// ---------------------------------------------------------------------------
// DocumentIndex — owns the id -> record store and the embedding provider.
//
// Thread-safe. Records are built outside the lock and swapped in whole, so a
// concurrent reader observes either the previous or the new record. A record
// keeps the position of its id's first insertion; reprocessing replaces the
// record without moving it.
// ---------------------------------------------------------------------------
class DocumentIndex {
public:
    // provider may be null. When embeddings are enabled the provider is
    // initialized here; a failed initialization leaves the index usable
    // without embeddings.
    explicit DocumentIndex(std::unique_ptr<IEmbeddingProvider> provider,
                           DocumentIndexOptions options = {});

    DocumentIndex(const DocumentIndex&) = delete;
    DocumentIndex& operator=(const DocumentIndex&) = delete;

    // Always recomputes; replaces any earlier record for id.
    DocumentRecord Process(const std::string& id, const std::string& content,
                           nlohmann::json metadata = nlohmann::json::object());

    // Sequential; results follow input order.
    std::vector<DocumentRecord> ProcessBatch(const std::vector<DocumentInput>& documents);

    [[nodiscard]] std::optional<DocumentRecord> Get(const std::string& id) const;
    [[nodiscard]] bool Contains(const std::string& id) const;

    // Linear scan over records carrying an embedding, ordered by descending
    // similarity, ties in insertion order. Empty when top_k is 0 or
    // embeddings are unavailable; InvalidArgument when top_k is negative.
    [[nodiscard]] Result<std::vector<SearchHit>, Error> SearchSimilar(
        std::string_view query, int top_k) const;

    [[nodiscard]] bool EmbeddingsAvailable() const;
    [[nodiscard]] std::size_t Size() const;
    [[nodiscard]] std::vector<std::string> Ids() const;
    [[nodiscard]] const DocumentIndexOptions& Options() const noexcept { return options_; }

private:
    using RecordPtr = std::shared_ptr<const DocumentRecord>;

    std::optional<Embedding> EmbedOne(const std::string& text) const;

    std::unique_ptr<IEmbeddingProvider> provider_;
    DocumentIndexOptions options_;
    bool embeddings_ready_ = false;
    mutable std::mutex provider_mutex_;  // providers need not be reentrant

    mutable std::shared_mutex mutex_;
    std::vector<RecordPtr> records_;                 // insertion order
    std::map<std::string, std::size_t> positions_;   // id -> index in records_
};

} // namespace archive_mcp
