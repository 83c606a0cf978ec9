// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/vector/snapshot_io.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstring>
#include <fstream>
#include <system_error>

namespace synvec::vector {

namespace {

constexpr char kMagic[4] = {'S', 'V', 'S', 'N'};
// Guards against allocating from a corrupted length field
constexpr uint32_t kMaxHeaderBytes = 1u << 20;
constexpr uint32_t kMaxIdBytes = 1u << 16;

void writeU32(std::ofstream& out, uint32_t v) {
    out.write(reinterpret_cast<const char*>(&v), sizeof(v));
}

bool readU32(std::ifstream& in, uint32_t& v) {
    in.read(reinterpret_cast<char*>(&v), sizeof(v));
    return static_cast<bool>(in);
}

} // namespace

Result<void> writeSnapshot(const std::filesystem::path& path, const PersistedSnapshot& snapshot) {
    if (snapshot.vectors.size() != snapshot.ids.size() * snapshot.dimension) {
        return Error{ErrorCode::InvalidArgument, "Vector blob size does not match id count"};
    }

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Failed to create snapshot directory: " + ec.message()};
        }
    }

    nlohmann::json header;
    header["modelVersion"] = snapshot.modelVersion;
    header["dimension"] = snapshot.dimension;
    header["count"] = snapshot.ids.size();
    header["createdAt"] = std::chrono::duration_cast<std::chrono::seconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
    const std::string headerText = header.dump();

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IOError, "Cannot open snapshot for writing: " + tmp.string()};
        }
        out.write(kMagic, sizeof(kMagic));
        writeU32(out, kSnapshotFormatVersion);
        writeU32(out, static_cast<uint32_t>(headerText.size()));
        out.write(headerText.data(), static_cast<std::streamsize>(headerText.size()));
        for (const auto& id : snapshot.ids) {
            writeU32(out, static_cast<uint32_t>(id.size()));
            out.write(id.data(), static_cast<std::streamsize>(id.size()));
        }
        out.write(reinterpret_cast<const char*>(snapshot.vectors.data()),
                  static_cast<std::streamsize>(snapshot.vectors.size() * sizeof(float)));
        out.flush();
        if (!out) {
            return Error{ErrorCode::IOError, "Failed writing snapshot: " + tmp.string()};
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::IOError, "Failed to publish snapshot file: " + path.string()};
    }
    return Result<void>();
}

Result<PersistedSnapshot> readSnapshot(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Snapshot not found: " + path.string()};
    }

    char magic[4] = {};
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        return Error{ErrorCode::CorruptedData, "Not a synvec snapshot: " + path.string()};
    }
    uint32_t format = 0;
    uint32_t headerLen = 0;
    if (!readU32(in, format) || !readU32(in, headerLen)) {
        return Error{ErrorCode::CorruptedData, "Truncated snapshot header"};
    }
    if (format != kSnapshotFormatVersion) {
        return Error{ErrorCode::InvalidData,
                     "Unsupported snapshot format version " + std::to_string(format)};
    }
    if (headerLen == 0 || headerLen > kMaxHeaderBytes) {
        return Error{ErrorCode::CorruptedData, "Invalid snapshot header length"};
    }

    std::string headerText(headerLen, '\0');
    in.read(headerText.data(), headerLen);
    if (!in) {
        return Error{ErrorCode::CorruptedData, "Truncated snapshot header"};
    }

    PersistedSnapshot snap;
    uint64_t count = 0;
    try {
        auto header = nlohmann::json::parse(headerText);
        snap.modelVersion = header.at("modelVersion").get<std::string>();
        snap.dimension = header.at("dimension").get<uint32_t>();
        count = header.at("count").get<uint64_t>();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::CorruptedData, std::string("Bad snapshot header: ") + e.what()};
    }

    // The header is untrusted: count and dimension must fit in what is left of the file
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    const std::streamoff pos = in.tellg();
    if (ec || pos < 0 || static_cast<uint64_t>(pos) > fileSize) {
        return Error{ErrorCode::IOError, "Cannot determine snapshot size: " + path.string()};
    }
    const uint64_t remaining = fileSize - static_cast<uint64_t>(pos);
    if (snap.dimension == 0 && count > 0) {
        return Error{ErrorCode::CorruptedData, "Snapshot header has zero dimension"};
    }
    if (count > remaining / sizeof(uint32_t)) {
        return Error{ErrorCode::CorruptedData,
                     "Snapshot header count " + std::to_string(count) + " exceeds file size"};
    }
    const uint64_t bytesPerVector = uint64_t{snap.dimension} * sizeof(float);
    if (count > 0 && bytesPerVector > (remaining - count * sizeof(uint32_t)) / count) {
        return Error{ErrorCode::CorruptedData, "Snapshot vector blob exceeds file size"};
    }

    snap.ids.reserve(static_cast<size_t>(count));
    for (size_t i = 0; i < count; ++i) {
        uint32_t len = 0;
        if (!readU32(in, len) || len > kMaxIdBytes || len > remaining) {
            return Error{ErrorCode::CorruptedData, "Corrupted id list in snapshot"};
        }
        std::string id(len, '\0');
        in.read(id.data(), len);
        if (!in) {
            return Error{ErrorCode::CorruptedData, "Truncated id list in snapshot"};
        }
        snap.ids.push_back(std::move(id));
    }

    snap.vectors.resize(static_cast<size_t>(count) * snap.dimension);
    in.read(reinterpret_cast<char*>(snap.vectors.data()),
            static_cast<std::streamsize>(snap.vectors.size() * sizeof(float)));
    if (!in) {
        return Error{ErrorCode::CorruptedData, "Truncated vector blob in snapshot"};
    }

    spdlog::debug("Read snapshot {} ({} vectors, dim {}, model {})", path.string(), count,
                  snap.dimension, snap.modelVersion);
    return snap;
}

} // namespace synvec::vector
