// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <synvec/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace synvec::vector {

/**
 * On-disk index snapshot: {modelVersion, dimension, idList, vectorBlob}.
 *
 * Layout (host byte order):
 *   "SVSN" | u32 format version | u32 header length | JSON header
 *   | per id: u32 length + bytes | count * dimension float32
 * The JSON header carries modelVersion, dimension, count and createdAt.
 */
struct PersistedSnapshot {
    std::string modelVersion;
    uint32_t dimension = 0;
    std::vector<PartId> ids;
    std::vector<float> vectors; // ids.size() * dimension values, row-major
};

inline constexpr uint32_t kSnapshotFormatVersion = 1;

/// Writes to a sibling temporary file and renames it over the target.
Result<void> writeSnapshot(const std::filesystem::path& path, const PersistedSnapshot& snapshot);

Result<PersistedSnapshot> readSnapshot(const std::filesystem::path& path);

} // namespace synvec::vector
