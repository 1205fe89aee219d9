#include "emb/EmbeddingCache.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

using hierarchy::Embedding;
using hierarchy::EmbeddingTable;
using hierarchy::InputError;
using hierarchy::NodeRecord;

// header: magic, version, record count, dim
// body:   n root vectors, then n parent vectors; each = u32 length (0 or dim) + floats
static constexpr uint32_t kMagic = 0x31564548;  // "HEV1"
static constexpr uint32_t kVersion = 1;

static size_t table_dim(const EmbeddingTable& t) {
    for (const auto& v : t.root) if (!v.empty()) return v.size();
    for (const auto& v : t.parent) if (!v.empty()) return v.size();
    return 0;
}

static void write_u32(std::ostream& out, uint32_t v) {
    out.write((const char*)&v, sizeof(v));
}

static bool read_u32(std::istream& in, uint32_t& v) {
    in.read((char*)&v, sizeof(v));
    return (bool)in;
}

static void write_vectors(std::ostream& out, const std::vector<Embedding>& vecs) {
    for (const auto& v : vecs) {
        write_u32(out, (uint32_t)v.size());
        out.write((const char*)v.data(), (std::streamsize)(sizeof(float) * v.size()));
    }
}

// `remaining` is the unread byte count; every length is checked against it before allocating.
static bool read_vectors(std::istream& in, uint32_t n, uint32_t dim, uint64_t& remaining,
                         std::vector<Embedding>& out) {
    out.clear();
    if ((uint64_t)n * sizeof(uint32_t) > remaining) return false;
    out.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        if (!read_u32(in, len)) return false;
        remaining -= sizeof(uint32_t);
        if (len != 0 && len != dim) return false;

        const uint64_t bytes = (uint64_t)len * sizeof(float);
        if (bytes > remaining) return false;

        Embedding v(len);
        in.read((char*)v.data(), (std::streamsize)bytes);
        if (!in) return false;
        remaining -= bytes;
        out.push_back(std::move(v));
    }
    return true;
}

bool EmbeddingCache::load(EmbeddingTable& out) const {
    std::error_code ec;
    const uintmax_t file_size = fs::file_size(m_path, ec);
    if (ec) return false;

    std::ifstream in(m_path, std::ios::binary);
    if (!in) return false;

    uint32_t magic = 0, version = 0, n = 0, dim = 0;
    if (!read_u32(in, magic) || magic != kMagic) return false;
    if (!read_u32(in, version) || version != kVersion) return false;
    if (!read_u32(in, n) || !read_u32(in, dim)) return false;

    const uint64_t header = 4 * sizeof(uint32_t);
    if (file_size < header) return false;
    uint64_t remaining = (uint64_t)file_size - header;

    // two vectors per record, each at least a length word
    if ((uint64_t)n * 2 * sizeof(uint32_t) > remaining) return false;

    EmbeddingTable t;
    if (!read_vectors(in, n, dim, remaining, t.root)) return false;
    if (!read_vectors(in, n, dim, remaining, t.parent)) return false;

    out = std::move(t);
    return true;
}

bool EmbeddingCache::save(const EmbeddingTable& table) const {
    if (table.root.size() != table.parent.size()) return false;

    const fs::path p(m_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) return false;
    }

    std::ofstream out(m_path, std::ios::binary | std::ios::trunc);
    if (!out) return false;

    write_u32(out, kMagic);
    write_u32(out, kVersion);
    write_u32(out, (uint32_t)table.size());
    write_u32(out, (uint32_t)table_dim(table));
    write_vectors(out, table.root);
    write_vectors(out, table.parent);

    out.flush();
    return (bool)out;
}

EmbeddingTable embed_records(const std::vector<NodeRecord>& records, const TextEmbedder& embedder) {
    std::vector<std::string> roots;
    std::vector<std::string> parents;
    roots.reserve(records.size());
    parents.reserve(records.size());
    for (const auto& r : records) {
        roots.push_back(r.root_description);
        parents.push_back(r.parent_short_summary);
    }

    EmbeddingTable t;
    t.root = embedder.embed_all(roots);
    t.parent = embedder.embed_all(parents);

    const size_t dim = table_dim(t);
    auto check = [&](const std::vector<Embedding>& vecs, const char* which) {
        for (size_t i = 0; i < vecs.size(); ++i) {
            if (!vecs[i].empty() && vecs[i].size() != dim) {
                throw InputError("inconsistent embedding dim for " + std::string(which) +
                                 " text of record " + std::to_string(i) + ": " +
                                 std::to_string(vecs[i].size()) + " vs " + std::to_string(dim));
            }
        }
    };
    check(t.root, "root_description");
    check(t.parent, "parent_short_summary");

    return t;
}

EmbeddingTable get_or_create_embeddings(const std::vector<NodeRecord>& records,
                                        const TextEmbedder& embedder,
                                        const EmbeddingCache& cache,
                                        bool rebuild,
                                        const ModelLoader& load_model) {
    if (!rebuild) {
        EmbeddingTable cached;
        if (cache.load(cached)) {
            if (cached.size() != records.size()) {
                throw InputError("embedding cache " + cache.path() + " holds " +
                                 std::to_string(cached.size()) + " records but dataset has " +
                                 std::to_string(records.size()) + "; rerun with --rebuild");
            }
            return cached;
        }
    }

    if (load_model && !embedder.ready() && !load_model()) {
        throw InputError("embedding cache " + cache.path() +
                         " is missing or unreadable and the embedding model failed to load");
    }
    if (!embedder.ready()) {
        throw InputError("embedding cache " + cache.path() +
                         " is missing or unreadable and no embedding model is loaded");
    }

    EmbeddingTable t = embed_records(records, embedder);

    if (!cache.save(t)) {
        std::cerr << "warning: failed to write embedding cache: " << cache.path() << "\n";
    }
    return t;
}
