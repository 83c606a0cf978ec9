// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/ml/embedding_provider.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string_view>

namespace synvec::ml {

namespace {

// FNV-1a, stable across platforms and standard library implementations
uint64_t fnv1a(std::string_view s, uint64_t seed) {
    uint64_t h = 1469598103934665603ULL ^ seed;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

} // namespace

Result<std::vector<EmbeddingVector>>
IEmbeddingProvider::encodeBatch(const std::vector<std::string>& texts) {
    std::vector<EmbeddingVector> out;
    out.reserve(texts.size());
    for (const auto& t : texts) {
        auto r = encode(t);
        if (!r) {
            return r.error();
        }
        out.push_back(std::move(r).value());
    }
    return out;
}

HashingEmbeddingProvider::HashingEmbeddingProvider(size_t dimension, std::string modelVersion)
    : dimension_(dimension), modelVersion_(std::move(modelVersion)) {
    spdlog::debug("HashingEmbeddingProvider created with dimension {} (model {})", dimension_,
                  modelVersion_);
}

Result<EmbeddingVector> HashingEmbeddingProvider::encode(const std::string& text) {
    if (dimension_ == 0) {
        return Error{ErrorCode::NotInitialized, "Hashing provider has zero dimension"};
    }

    EmbeddingVector ev;
    ev.modelVersion = modelVersion_;
    ev.values.assign(dimension_, 0.0f);

    std::string token;
    auto flush = [&]() {
        if (token.empty())
            return;
        // Two hashed features per token: bucket + sign from independent seeds
        for (uint64_t seed = 0; seed < 2; ++seed) {
            auto h = fnv1a(token, seed * 0x9E3779B97F4A7C15ULL);
            auto bucket = static_cast<size_t>(h % dimension_);
            float sign = ((h >> 63) & 1U) ? -1.0f : 1.0f;
            ev.values[bucket] += sign;
        }
        token.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            token.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();

    float norm = 0.0f;
    for (float v : ev.values)
        norm += v * v;
    norm = std::sqrt(norm);
    if (norm > 0.0f) {
        for (float& v : ev.values)
            v /= norm;
    } else {
        // Empty text: a fixed unit vector keeps downstream cosine math defined
        ev.values[0] = 1.0f;
    }
    return ev;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            size_t dimension,
                                                            const std::string& modelVersion) {
    if (name.empty() || name == "hashing") {
        return std::make_unique<HashingEmbeddingProvider>(dimension, modelVersion);
    }
    spdlog::warn("Unknown embedding provider '{}'", name);
    return nullptr;
}

} // namespace synvec::ml
