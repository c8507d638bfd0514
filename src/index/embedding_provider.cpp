#include <archive_mcp/index/embedding_provider.hpp>

#include <archive_mcp/core/log.hpp>

#include <cmath>
#include <random>
#include <stdexcept>

namespace archive_mcp {

double CosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument(
            "Embedding size mismatch: " + std::to_string(a.size()) +
            " vs " + std::to_string(b.size()));
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }

    auto sim = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    // Rounding can push |sim| a hair past 1.
    if (sim > 1.0) return 1.0;
    if (sim < -1.0) return -1.0;
    return sim;
}

std::uint64_t Fnv1a64(std::string_view text) noexcept {
    std::uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

HashEmbeddingProvider::HashEmbeddingProvider(std::size_t dimension)
    : dimension_(dimension) {}

bool HashEmbeddingProvider::Initialize() {
    if (dimension_ == 0) {
        LogWarn("embedding", "Cannot initialize hash embeddings with dimension 0");
        ready_ = false;
        return false;
    }
    ready_ = true;
    LogDebug("embedding", "Hash embedding placeholder ready, dimension " +
                              std::to_string(dimension_));
    return true;
}

std::vector<Embedding> HashEmbeddingProvider::Embed(
    const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    if (!ready_) {
        return out;
    }
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(EmbedOne(text));
    }
    return out;
}

Embedding HashEmbeddingProvider::EmbedOne(std::string_view text) const {
    const auto hash = Fnv1a64(text);
    std::mt19937 rng(static_cast<std::mt19937::result_type>(hash ^ (hash >> 32)));
    std::normal_distribution<float> dist(0.0f, 1.0f);

    Embedding v(dimension_);
    for (auto& x : v) {
        x = dist(rng);
    }
    return v;
}

} // namespace archive_mcp
