#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace archive_mcp {

using Embedding = std::vector<float>;

// Cosine similarity in [-1, 1]. Returns 0.0 when either vector has zero
// magnitude. Throws std::invalid_argument when the sizes differ.
double CosineSimilarity(const Embedding& a, const Embedding& b);

// ---------------------------------------------------------------------------
// IEmbeddingProvider — turns text into fixed-dimension vectors.
//
// DocumentIndex depends only on this interface, so a real model can replace
// the placeholder without touching the index or the dispatcher.
//
// Initialize() reports failure as false, never by throwing. A provider that
// is not ready returns an empty list from Embed().
// ---------------------------------------------------------------------------
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    IEmbeddingProvider() = default;
    IEmbeddingProvider(const IEmbeddingProvider&) = delete;
    IEmbeddingProvider& operator=(const IEmbeddingProvider&) = delete;

    [[nodiscard]] virtual bool Initialize() = 0;
    [[nodiscard]] virtual bool IsReady() const = 0;
    [[nodiscard]] virtual std::size_t Dimension() const = 0;

    // One vector per input text, in input order.
    [[nodiscard]] virtual std::vector<Embedding> Embed(
        const std::vector<std::string>& texts) = 0;

    [[nodiscard]] virtual double Similarity(const Embedding& a,
                                            const Embedding& b) const {
        return CosineSimilarity(a, b);
    }
};

// ---------------------------------------------------------------------------
// HashEmbeddingProvider — PLACEHOLDER, not a semantic model.
//
// Each text seeds a std::mt19937 with the FNV-1a hash of its bytes and draws
// Dimension() standard-normal samples. Identical text yields the identical
// vector, which keeps indexing and search reproducible; the vectors carry no
// meaning. Initialize() fails when the dimension is 0.
// ---------------------------------------------------------------------------
class HashEmbeddingProvider : public IEmbeddingProvider {
public:
    static constexpr std::size_t kDefaultDimension = 384;

    explicit HashEmbeddingProvider(std::size_t dimension = kDefaultDimension);

    bool Initialize() override;
    [[nodiscard]] bool IsReady() const override { return ready_; }
    [[nodiscard]] std::size_t Dimension() const override { return dimension_; }

    std::vector<Embedding> Embed(const std::vector<std::string>& texts) override;

private:
    [[nodiscard]] Embedding EmbedOne(std::string_view text) const;

    std::size_t dimension_;
    bool ready_ = false;
};

// 64-bit FNV-1a; stable across platforms and runs.
std::uint64_t Fnv1a64(std::string_view text) noexcept;

} // namespace archive_mcp
