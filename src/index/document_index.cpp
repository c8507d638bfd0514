#include <archive_mcp/index/document_index.hpp>

#include <archive_mcp/core/log.hpp>

#include <algorithm>
#include <utility>

namespace archive_mcp {

DocumentIndex::DocumentIndex(std::unique_ptr<IEmbeddingProvider> provider,
                             DocumentIndexOptions options)
    : provider_(std::move(provider)), options_(options) {
    if (!options_.use_embeddings) {
        LogInfo("index", "Embeddings disabled; semantic search unavailable");
        return;
    }
    if (!provider_) {
        LogWarn("index", "Embeddings enabled but no provider configured");
        return;
    }
    embeddings_ready_ = provider_->Initialize();
    if (!embeddings_ready_) {
        LogWarn("index", "Embedding provider failed to initialize; "
                         "documents will be indexed without embeddings");
    }
}

bool DocumentIndex::EmbeddingsAvailable() const {
    return options_.use_embeddings && embeddings_ready_ && provider_ &&
           provider_->IsReady();
}

std::optional<Embedding> DocumentIndex::EmbedOne(const std::string& text) const {
    if (!EmbeddingsAvailable()) {
        return std::nullopt;
    }
    std::vector<Embedding> vectors;
    {
        std::lock_guard<std::mutex> lock(provider_mutex_);
        vectors = provider_->Embed({text});
    }
    if (vectors.size() != 1 || vectors.front().empty()) {
        LogWarn("index", "Embedding provider returned no vector");
        return std::nullopt;
    }
    return std::move(vectors.front());
}

DocumentRecord DocumentIndex::Process(const std::string& id,
                                      const std::string& content,
                                      nlohmann::json metadata) {
    auto record = std::make_shared<DocumentRecord>();
    record->id = id;
    record->content = content;
    record->summary = GenerateSummary(content, options_.summary_max_length);
    record->word_count = CountWords(content);
    record->char_count = content.size();
    record->embedding = EmbedOne(content);
    record->metadata = metadata.is_object() ? std::move(metadata)
                                            : nlohmann::json::object();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = positions_.find(id);
        if (it == positions_.end()) {
            positions_.emplace(id, records_.size());
            records_.push_back(record);
        } else {
            records_[it->second] = record;
        }
    }

    LogDebug("index", "Processed " + id + " (" +
                          std::to_string(record->word_count) + " words)");
    return *record;
}

std::vector<DocumentRecord> DocumentIndex::ProcessBatch(
    const std::vector<DocumentInput>& documents) {
    std::vector<DocumentRecord> out;
    out.reserve(documents.size());
    for (const auto& doc : documents) {
        out.push_back(Process(doc.id, doc.content, doc.metadata));
    }
    return out;
}

std::optional<DocumentRecord> DocumentIndex::Get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        return std::nullopt;
    }
    return *records_[it->second];
}

bool DocumentIndex::Contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return positions_.count(id) > 0;
}

std::size_t DocumentIndex::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

std::vector<std::string> DocumentIndex::Ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(records_.size());
    for (const auto& r : records_) {
        ids.push_back(r->id);
    }
    return ids;
}

Result<std::vector<SearchHit>, Error> DocumentIndex::SearchSimilar(
    std::string_view query, int top_k) const {
    using R = Result<std::vector<SearchHit>, Error>;

    if (top_k < 0) {
        return R::Err(Error{"SearchSimilar",
                            "top_k must be non-negative, got " + std::to_string(top_k),
                            ErrorCategory::InvalidArgument, std::nullopt});
    }
    if (top_k == 0 || !EmbeddingsAvailable()) {
        return R::Ok(std::vector<SearchHit>{});
    }

    auto query_vec = EmbedOne(std::string(query));
    if (!query_vec) {
        return R::Ok(std::vector<SearchHit>{});
    }

    // Snapshot under the shared lock; score outside it.
    std::vector<RecordPtr> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot = records_;
    }

    std::vector<SearchHit> hits;
    hits.reserve(snapshot.size());
    for (const auto& record : snapshot) {
        if (!record->embedding) continue;
        hits.push_back({record->id, record->summary,
                        provider_->Similarity(*query_vec, *record->embedding)});
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const SearchHit& a, const SearchHit& b) {
                         return a.similarity > b.similarity;
                     });
    if (hits.size() > static_cast<std::size_t>(top_k)) {
        hits.resize(static_cast<std::size_t>(top_k));
    }
    return R::Ok(std::move(hits));
}

} // namespace archive_mcp
