// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>

#include <memory>
#include <string>
#include <vector>

namespace synvec::ml {

/**
 * @brief A vector produced by a specific embedding model version
 */
struct EmbeddingVector {
    std::vector<float> values;
    std::string modelVersion;

    size_t dimension() const { return values.size(); }
};

// ============================================================================
// Abstract Embedding Provider Interface
// ============================================================================

/**
 * Abstract interface for embedding providers.
 * The engine consumes the text model as an external capability; this seam keeps it
 * independent of any model runtime.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    /**
     * Encode a single text
     * @return Vector tagged with modelVersion() or error
     */
    virtual Result<EmbeddingVector> encode(const std::string& text) = 0;

    /**
     * Encode a batch of texts. The default forwards to encode() one text at a time and fails
     * on the first error.
     */
    virtual Result<std::vector<EmbeddingVector>> encodeBatch(const std::vector<std::string>& texts);

    /// Model identifier stamped on every vector (e.g. "all-MiniLM-L6-v2")
    virtual std::string modelVersion() const = 0;

    /// Output dimension for modelVersion()
    virtual size_t dimension() const = 0;

    virtual bool isAvailable() const = 0;

    virtual std::string getProviderName() const = 0;
};

/**
 * Deterministic feature-hashing provider.
 *
 * Tokens (lower-cased alphanumeric runs) are hashed into signed buckets and the result is
 * L2-normalised, so texts sharing vocabulary land close together. Same text and model version
 * always yield the same vector.
 */
class HashingEmbeddingProvider final : public IEmbeddingProvider {
public:
    explicit HashingEmbeddingProvider(size_t dimension = 384,
                                      std::string modelVersion = "synvec-hash-v1");

    Result<EmbeddingVector> encode(const std::string& text) override;
    std::string modelVersion() const override { return modelVersion_; }
    size_t dimension() const override { return dimension_; }
    bool isAvailable() const override { return dimension_ > 0; }
    std::string getProviderName() const override { return "Hashing"; }

private:
    size_t dimension_;
    std::string modelVersion_;
};

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension,
                                                            const std::string& modelVersion);

} // namespace synvec::ml
