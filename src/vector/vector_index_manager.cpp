// Copyright 2025 The SynVec Authors
// SPDX-License-Identifier: Apache-2.0

#include <synvec/vector/snapshot_io.h>
#include <synvec/vector/vector_index_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <optional>
#include <queue>
#include <unordered_map>

// Include HNSWlib before namespace to avoid namespace conflicts
#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wcast-qual"
#endif
#include <hnswlib/hnswlib.h>
#if defined(__clang__)
#pragma clang diagnostic pop
#endif

namespace synvec::vector {

// =============================================================================
// Arena and graph
// =============================================================================

struct IndexSnapshot::Arena {
    static constexpr size_t kBlockSlots = 1024;
    static constexpr size_t kIdShards = 256;

    struct Block {
        std::vector<float> data; // ids.size() * dimension
        std::vector<PartId> ids;
    };
    using LiveBits = std::vector<bool>; // one per block
    using IdMap = std::unordered_map<PartId, uint32_t>;

    size_t dimension = 0;
    std::string modelVersion;
    bool normalized = true;

    std::vector<std::shared_ptr<const Block>> blocks;
    std::vector<std::shared_ptr<const LiveBits>> live;      // parallel to blocks
    std::array<std::shared_ptr<const IdMap>, kIdShards> ids; // live ids only, sharded by hash
    size_t slots = 0;
    size_t liveCount = 0;

    // Pieces this arena may write in place. A fork shares everything with the published arena
    // and copies each piece once, before its first write.
    std::vector<bool> ownedBlocks;
    std::vector<bool> ownedLive;
    std::array<bool, kIdShards> ownedIds{};
    size_t copiedBlocks = 0;

    std::shared_ptr<Arena> fork() const {
        auto out = std::make_shared<Arena>(*this);
        out->ownedBlocks.assign(blocks.size(), false);
        out->ownedLive.assign(live.size(), false);
        out->ownedIds.fill(false);
        out->copiedBlocks = 0;
        return out;
    }

    static size_t idShard(const PartId& id) { return std::hash<PartId>{}(id) % kIdShards; }

    const float* vectorAt(size_t slot) const {
        const auto& b = blocks[slot / kBlockSlots];
        return b->data.data() + (slot % kBlockSlots) * dimension;
    }

    const PartId& idAt(size_t slot) const { return blocks[slot / kBlockSlots]->ids[slot % kBlockSlots]; }

    bool isLive(size_t slot) const {
        auto b = slot / kBlockSlots;
        return b < live.size() && (*live[b])[slot % kBlockSlots];
    }

    std::optional<uint32_t> slotFor(const PartId& id) const {
        const auto& shard = ids[idShard(id)];
        if (!shard)
            return std::nullopt;
        auto it = shard->find(id);
        if (it == shard->end())
            return std::nullopt;
        return it->second;
    }

    Block& writableBlock(size_t b) {
        if (!ownedBlocks[b]) {
            blocks[b] = std::make_shared<Block>(*blocks[b]);
            ownedBlocks[b] = true;
            ++copiedBlocks;
        }
        return *std::const_pointer_cast<Block>(blocks[b]);
    }

    LiveBits& writableLive(size_t b) {
        if (!ownedLive[b]) {
            live[b] = std::make_shared<LiveBits>(*live[b]);
            ownedLive[b] = true;
        }
        return *std::const_pointer_cast<LiveBits>(live[b]);
    }

    IdMap& writableIds(const PartId& id) {
        auto s = idShard(id);
        if (!ownedIds[s]) {
            ids[s] = ids[s] ? std::make_shared<IdMap>(*ids[s]) : std::make_shared<IdMap>();
            ownedIds[s] = true;
        }
        return *std::const_pointer_cast<IdMap>(ids[s]);
    }

    void append(const PartId& id, const std::vector<float>& values) {
        if (blocks.empty() || blocks.back()->ids.size() == kBlockSlots) {
            auto b = std::make_shared<Block>();
            b->data.reserve(kBlockSlots * dimension);
            b->ids.reserve(kBlockSlots);
            blocks.push_back(std::move(b));
            ownedBlocks.push_back(true);
            auto bits = std::make_shared<LiveBits>();
            bits->reserve(kBlockSlots);
            live.push_back(std::move(bits));
            ownedLive.push_back(true);
        }
        auto tail = blocks.size() - 1;
        auto& block = writableBlock(tail);
        block.data.insert(block.data.end(), values.begin(), values.end());
        block.ids.push_back(id);
        writableLive(tail).push_back(true);

        auto slot = static_cast<uint32_t>(slots++);
        writableIds(id)[id] = slot;
        ++liveCount;
    }

    bool kill(const PartId& id) {
        auto slot = slotFor(id);
        if (!slot)
            return false;
        writableLive(*slot / kBlockSlots)[*slot % kBlockSlots] = false;
        writableIds(id).erase(id);
        --liveCount;
        return true;
    }

    double deadRatio() const {
        return slots == 0 ? 0.0
                          : static_cast<double>(slots - liveCount) / static_cast<double>(slots);
    }
};

struct IndexSnapshot::Graph {
    std::unique_ptr<hnswlib::InnerProductSpace> space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index;
    size_t coveredSlots = 0;
};

namespace {

using Arena = IndexSnapshot::Arena;
using Graph = IndexSnapshot::Graph;
using Candidate = std::pair<float, uint32_t>; // distance, slot

class LiveSlotFilter : public hnswlib::BaseFilterFunctor {
public:
    explicit LiveSlotFilter(const Arena& arena) : arena_(arena) {}
    bool operator()(hnswlib::labeltype label) override { return arena_.isLive(label); }

private:
    const Arena& arena_;
};

std::shared_ptr<Arena> compactArena(const Arena& src) {
    auto out = std::make_shared<Arena>();
    out->dimension = src.dimension;
    out->modelVersion = src.modelVersion;
    out->normalized = src.normalized;
    std::vector<float> tmp(src.dimension);
    for (size_t slot = 0; slot < src.slots; ++slot) {
        if (!src.isLive(slot))
            continue;
        const float* v = src.vectorAt(slot);
        tmp.assign(v, v + src.dimension);
        out->append(src.idAt(slot), tmp);
    }
    return out;
}

std::shared_ptr<const Graph> buildGraph(const Arena& arena, const IndexConfig& config) {
    auto start = std::chrono::steady_clock::now();
    auto graph = std::make_shared<Graph>();
    graph->space = std::make_unique<hnswlib::InnerProductSpace>(arena.dimension);
    graph->index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
        graph->space.get(), std::max<size_t>(arena.liveCount, 1), config.hnsw_m,
        config.hnsw_ef_construction, config.hnsw_seed);
    for (size_t slot = 0; slot < arena.slots; ++slot) {
        if (arena.isLive(slot)) {
            graph->index->addPoint(arena.vectorAt(slot), static_cast<hnswlib::labeltype>(slot));
        }
    }
    graph->index->setEf(config.hnsw_ef_search);
    graph->coveredSlots = arena.slots;

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::steady_clock::now() - start)
                  .count();
    spdlog::info("VectorIndex: built HNSW graph over {} vectors in {} ms (M={}, efC={})",
                 arena.liveCount, ms, config.hnsw_m, config.hnsw_ef_construction);
    return graph;
}

} // namespace

// =============================================================================
// IndexSnapshot
// =============================================================================

IndexSnapshot::IndexSnapshot(uint64_t version, std::shared_ptr<const Arena> arena,
                             std::shared_ptr<const Graph> graph, size_t exactThreshold,
                             std::chrono::system_clock::time_point publishedAt)
    : version_(version), arena_(std::move(arena)), graph_(std::move(graph)),
      exactThreshold_(exactThreshold), publishedAt_(publishedAt) {}

IndexSnapshot::~IndexSnapshot() = default;

size_t IndexSnapshot::size() const {
    return arena_->liveCount;
}
size_t IndexSnapshot::dimension() const {
    return arena_->dimension;
}
const std::string& IndexSnapshot::modelVersion() const {
    return arena_->modelVersion;
}
size_t IndexSnapshot::arenaSlots() const {
    return arena_->slots;
}
size_t IndexSnapshot::graphSlots() const {
    return graph_ ? graph_->coveredSlots : 0;
}
bool IndexSnapshot::approximate() const {
    return graph_ != nullptr && arena_->liveCount >= exactThreshold_;
}

bool IndexSnapshot::contains(const PartId& id) const {
    return arena_->slotFor(id).has_value();
}

std::optional<std::vector<float>> IndexSnapshot::vectorOf(const PartId& id) const {
    auto slot = arena_->slotFor(id);
    if (!slot)
        return std::nullopt;
    const float* v = arena_->vectorAt(*slot);
    return std::vector<float>(v, v + arena_->dimension);
}

std::vector<PartId> IndexSnapshot::ids() const {
    std::vector<PartId> out;
    out.reserve(arena_->liveCount);
    for (size_t slot = 0; slot < arena_->slots; ++slot) {
        if (arena_->isLive(slot))
            out.push_back(arena_->idAt(slot));
    }
    return out;
}

void IndexSnapshot::exactScan(const float* q, size_t fromSlot, size_t k,
                              std::vector<Candidate>& out, const std::atomic<bool>* cancelled,
                              bool& wasCancelled) const {
    const Arena& arena = *arena_;
    // Max-heap on (distance, id): top is the current worst of the k kept
    auto worse = [&arena](const Candidate& a, const Candidate& b) {
        if (a.first != b.first)
            return a.first < b.first;
        return arena.idAt(a.second) < arena.idAt(b.second);
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(worse)> heap(worse);

    for (size_t slot = fromSlot; slot < arena.slots; ++slot) {
        if (cancelled && (slot & 0x3FF) == 0 && cancelled->load(std::memory_order_relaxed)) {
            wasCancelled = true;
            return;
        }
        if (!arena.isLive(slot))
            continue;
        float d = vector_utils::cosineDistance(q, arena.vectorAt(slot), arena.dimension);
        Candidate c{d, static_cast<uint32_t>(slot)};
        if (heap.size() < k) {
            heap.push(c);
        } else if (worse(c, heap.top())) {
            heap.pop();
            heap.push(c);
        }
    }
    while (!heap.empty()) {
        out.push_back(heap.top());
        heap.pop();
    }
}

Result<std::vector<Neighbor>> IndexSnapshot::query(const std::vector<float>& vector, size_t k,
                                                   const std::atomic<bool>* cancelled) const {
    const Arena& arena = *arena_;
    if (vector.size() != arena.dimension) {
        return Error{ErrorCode::DimensionMismatch,
                     "Query dimension " + std::to_string(vector.size()) + " != index dimension " +
                         std::to_string(arena.dimension)};
    }
    std::vector<Neighbor> results;
    if (arena.liveCount == 0 || k == 0) {
        return results;
    }

    std::vector<float> q = arena.normalized ? vector_utils::normalize(vector) : vector;
    std::vector<Candidate> candidates;
    bool wasCancelled = false;

    if (approximate()) {
        try {
            LiveSlotFilter filter(arena);
            auto heap = graph_->index->searchKnn(q.data(), k, &filter);
            while (!heap.empty()) {
                candidates.emplace_back(heap.top().first, static_cast<uint32_t>(heap.top().second));
                heap.pop();
            }
        } catch (const std::exception& e) {
            return Error{ErrorCode::InternalError, std::string("HNSW search failed: ") + e.what()};
        }
        exactScan(q.data(), graph_->coveredSlots, k, candidates, cancelled, wasCancelled);
    } else {
        exactScan(q.data(), 0, k, candidates, cancelled, wasCancelled);
    }

    if (wasCancelled) {
        return Error{ErrorCode::OperationCancelled, "Vector query cancelled"};
    }

    std::sort(candidates.begin(), candidates.end(),
              [&arena](const Candidate& a, const Candidate& b) {
                  if (a.first != b.first)
                      return a.first < b.first;
                  return arena.idAt(a.second) < arena.idAt(b.second);
              });
    if (candidates.size() > k) {
        candidates.resize(k);
    }
    results.reserve(candidates.size());
    for (const auto& [dist, slot] : candidates) {
        results.push_back(Neighbor{arena.idAt(slot), dist});
    }
    return results;
}

// =============================================================================
// VectorIndexManager
// =============================================================================

VectorIndexManager::VectorIndexManager(const IndexConfig& config) : config_(config) {
    auto arena = std::make_shared<Arena>();
    arena->dimension = config_.dimension;
    arena->modelVersion = config_.model_version;
    arena->normalized = config_.normalize_vectors;
    std::atomic_store(&current_, SnapshotHandle(std::make_shared<const IndexSnapshot>(
                                     0, std::move(arena), nullptr, config_.exact_threshold,
                                     std::chrono::system_clock::now())));
    spdlog::debug("VectorIndexManager created (dim={}, model={}, exact_threshold={})",
                  config_.dimension, config_.model_version, config_.exact_threshold);
}

VectorIndexManager::~VectorIndexManager() = default;

SnapshotHandle VectorIndexManager::acquire() const {
    return std::atomic_load(&current_);
}

Result<void> VectorIndexManager::insert(const PartId& id, const std::vector<float>& vector) {
    std::vector<VectorEntry> batch;
    batch.push_back(VectorEntry{id, vector});
    auto report = insertBatch(std::move(batch));
    if (!report.failures.empty()) {
        return report.failures.front().error;
    }
    return Result<void>();
}

Result<void> VectorIndexManager::insert(const PartId& id, const ml::EmbeddingVector& vector) {
    if (vector.modelVersion != config_.model_version) {
        return Error{ErrorCode::InvalidData, "Vector model version '" + vector.modelVersion +
                                                  "' does not match index model '" +
                                                  config_.model_version + "'"};
    }
    return insert(id, vector.values);
}

BatchInsertReport VectorIndexManager::insertBatch(std::vector<VectorEntry> entries) {
    std::vector<Mutation> mutations;
    mutations.reserve(entries.size());
    for (auto& e : entries) {
        mutations.push_back(Mutation{std::move(e.id), std::move(e.values)});
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    return applyLocked(std::move(mutations), false, false);
}

BatchInsertReport VectorIndexManager::replaceAll(std::vector<VectorEntry> entries) {
    std::vector<Mutation> mutations;
    mutations.reserve(entries.size());
    for (auto& e : entries) {
        mutations.push_back(Mutation{std::move(e.id), std::move(e.values)});
    }
    std::lock_guard<std::mutex> lock(writeMutex_);
    return applyLocked(std::move(mutations), true, true);
}

Result<void> VectorIndexManager::remove(const PartId& id) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (!std::atomic_load(&current_)->contains(id)) {
        return Error{ErrorCode::NotFound, "Vector not found: " + id};
    }
    std::vector<Mutation> mutations;
    mutations.push_back(Mutation{id, {}, true});
    applyLocked(std::move(mutations), false, false);
    return Result<void>();
}

Result<void> VectorIndexManager::rebuild() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    auto report = applyLocked({}, true, false);
    if (!report.failures.empty()) {
        return report.failures.front().error;
    }
    return Result<void>();
}

BatchInsertReport VectorIndexManager::applyLocked(std::vector<Mutation> mutations,
                                                  bool forceRebuild, bool startEmpty) {
    BatchInsertReport report;
    auto base = std::atomic_load(&current_);

    std::shared_ptr<Arena> arena;
    if (startEmpty) {
        arena = std::make_shared<Arena>();
        arena->dimension = config_.dimension;
        arena->modelVersion = config_.model_version;
        arena->normalized = config_.normalize_vectors;
    } else {
        arena = base->arena()->fork();
    }

    for (auto& m : mutations) {
        if (m.id.empty()) {
            report.failures.push_back({m.id, Error{ErrorCode::InvalidArgument, "Empty vector id"}});
            continue;
        }
        if (m.erase) {
            arena->kill(m.id);
            continue;
        }
        if (m.values.size() != config_.dimension) {
            spdlog::warn("VectorIndex: rejecting '{}' (dimension {} != {})", m.id, m.values.size(),
                         config_.dimension);
            report.failures.push_back(
                {m.id, Error{ErrorCode::DimensionMismatch,
                             "Vector dimension " + std::to_string(m.values.size()) +
                                 " != index dimension " + std::to_string(config_.dimension)}});
            continue;
        }
        if (!std::all_of(m.values.begin(), m.values.end(),
                         [](float v) { return std::isfinite(v); })) {
            report.failures.push_back(
                {m.id, Error{ErrorCode::InvalidArgument, "Vector contains non-finite values"}});
            continue;
        }
        if (config_.normalize_vectors) {
            m.values = vector_utils::normalize(m.values);
        }
        // Re-embedding replaces: the old slot goes dead, the id moves to a new slot
        if (arena->kill(m.id)) {
            ++report.replaced;
        } else {
            ++report.inserted;
        }
        arena->append(m.id, m.values);
    }

    report.copiedBlocks = arena->copiedBlocks;
    bool compacted = false;
    if (forceRebuild || arena->deadRatio() > config_.compaction_ratio) {
        if (arena->slots != arena->liveCount) {
            arena = compactArena(*arena);
            compacted = true;
        }
    }

    std::shared_ptr<const Graph> graph;
    if (arena->liveCount >= config_.exact_threshold) {
        const auto& prev = startEmpty ? nullptr : base->graph();
        bool deltaFull =
            !prev || arena->slots - std::min(arena->slots, prev->coveredSlots) >= config_.delta_threshold;
        if (forceRebuild || compacted || deltaFull) {
            try {
                graph = buildGraph(*arena, config_);
            } catch (const std::exception& e) {
                // Exact scans remain correct without a graph
                spdlog::error("VectorIndex: HNSW build failed, serving exact scans: {}", e.what());
                graph = nullptr;
            }
        } else {
            graph = prev;
        }
    }

    auto next = std::make_shared<const IndexSnapshot>(nextVersion_++, std::move(arena),
                                                      std::move(graph), config_.exact_threshold,
                                                      std::chrono::system_clock::now());
    report.snapshotVersion = next->version();
    publishLocked(std::move(next));
    return report;
}

void VectorIndexManager::publishLocked(SnapshotHandle next) {
    spdlog::debug("VectorIndex: publishing snapshot v{} ({} live, {} slots, graph covers {})",
                  next->version(), next->size(), next->arenaSlots(), next->graphSlots());
    std::atomic_store(&current_, std::move(next));
}

Result<std::vector<Neighbor>> VectorIndexManager::query(const std::vector<float>& vector, size_t k,
                                                        const std::atomic<bool>* cancelled) {
    auto start = std::chrono::steady_clock::now();
    auto snapshot = acquire();
    auto result = snapshot->query(vector, k, cancelled);
    recordQuery(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start));
    return result;
}

void VectorIndexManager::recordQuery(std::chrono::microseconds elapsed) {
    totalQueries_.fetch_add(1, std::memory_order_relaxed);
    totalQueryMicros_.fetch_add(static_cast<uint64_t>(elapsed.count()), std::memory_order_relaxed);
}

bool VectorIndexManager::isStale() const {
    if (config_.stale_after.count() <= 0) {
        return false;
    }
    return std::chrono::system_clock::now() - acquire()->publishedAt() > config_.stale_after;
}

size_t VectorIndexManager::size() const {
    return acquire()->size();
}

IndexStats VectorIndexManager::getStats() const {
    auto snap = acquire();
    IndexStats s;
    s.count = snap->size();
    s.dimension = snap->dimension();
    s.modelVersion = snap->modelVersion();
    s.snapshotVersion = snap->version();
    s.arenaSlots = snap->arenaSlots();
    s.graphSlots = snap->graphSlots();
    s.deltaSlots = s.arenaSlots - std::min(s.arenaSlots, s.graphSlots);
    s.approximate = snap->approximate();
    s.publishedAt = snap->publishedAt();
    s.totalQueries = totalQueries_.load(std::memory_order_relaxed);
    if (s.totalQueries > 0) {
        s.avgQueryLatencyMs = static_cast<double>(totalQueryMicros_.load(std::memory_order_relaxed)) /
                              static_cast<double>(s.totalQueries) / 1000.0;
    }
    return s;
}

Result<void> VectorIndexManager::saveSnapshot(const std::filesystem::path& path) const {
    auto snap = acquire();
    PersistedSnapshot out;
    out.modelVersion = snap->modelVersion();
    out.dimension = static_cast<uint32_t>(snap->dimension());
    const auto& arena = *snap->arena();
    out.ids.reserve(arena.liveCount);
    out.vectors.reserve(arena.liveCount * arena.dimension);
    for (size_t slot = 0; slot < arena.slots; ++slot) {
        if (!arena.isLive(slot))
            continue;
        out.ids.push_back(arena.idAt(slot));
        const float* v = arena.vectorAt(slot);
        out.vectors.insert(out.vectors.end(), v, v + arena.dimension);
    }
    auto r = writeSnapshot(path, out);
    if (r) {
        spdlog::info("VectorIndex: saved snapshot v{} ({} vectors) to {}", snap->version(),
                     out.ids.size(), path.string());
    }
    return r;
}

Result<void> VectorIndexManager::loadSnapshot(const std::filesystem::path& path) {
    auto loaded = readSnapshot(path);
    if (!loaded) {
        return loaded.error();
    }
    const auto& snap = loaded.value();
    if (snap.modelVersion != config_.model_version) {
        return Error{ErrorCode::InvalidData, "Snapshot model '" + snap.modelVersion +
                                                 "' does not match index model '" +
                                                 config_.model_version + "'"};
    }
    if (snap.dimension != config_.dimension) {
        return Error{ErrorCode::DimensionMismatch,
                     "Snapshot dimension " + std::to_string(snap.dimension) +
                         " != index dimension " + std::to_string(config_.dimension)};
    }

    std::vector<VectorEntry> entries;
    entries.reserve(snap.ids.size());
    for (size_t i = 0; i < snap.ids.size(); ++i) {
        auto first = snap.vectors.begin() + static_cast<std::ptrdiff_t>(i * snap.dimension);
        entries.push_back(
            VectorEntry{snap.ids[i], std::vector<float>(first, first + snap.dimension)});
    }
    auto report = replaceAll(std::move(entries));
    spdlog::info("VectorIndex: loaded {} vectors from {} (snapshot v{}, {} rejected)",
                 report.inserted + report.replaced, path.string(), report.snapshotVersion,
                 report.failures.size());
    return Result<void>();
}

// =============================================================================
// Utilities
// =============================================================================

namespace vector_utils {

std::vector<float> normalize(const std::vector<float>& vector) {
    float norm = 0.0f;
    for (float v : vector)
        norm += v * v;
    norm = std::sqrt(norm);
    if (norm <= 0.0f)
        return vector;
    std::vector<float> out(vector.size());
    for (size_t i = 0; i < vector.size(); ++i)
        out[i] = vector[i] / norm;
    return out;
}

float innerProduct(const float* a, const float* b, size_t dim) {
    float s = 0.0f;
    for (size_t i = 0; i < dim; ++i)
        s += a[i] * b[i];
    return s;
}

float cosineDistance(const float* a, const float* b, size_t dim) {
    return 1.0f - innerProduct(a, b, dim);
}

} // namespace vector_utils

} // namespace synvec::vector
