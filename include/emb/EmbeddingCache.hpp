#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "emb/TextEmbedder.hpp"
#include "hierarchy/Models.hpp"

// Binary root/parent embedding table stored at a fixed path.
class EmbeddingCache {
public:
    explicit EmbeddingCache(std::string path) : m_path(std::move(path)) {}

    // false if the file is missing, truncated or not a cache file
    bool load(hierarchy::EmbeddingTable& out) const;

    // creates parent directories; false on I/O failure
    bool save(const hierarchy::EmbeddingTable& table) const;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// Embeds root_description and parent_short_summary of every record.
// Throws hierarchy::InputError if the embedder returns vectors of differing lengths.
hierarchy::EmbeddingTable embed_records(const std::vector<hierarchy::NodeRecord>& records,
                                        const TextEmbedder& embedder);

// Called only when the table has to be embedded; false means the model could not be loaded.
using ModelLoader = std::function<bool()>;

// Cached table if present (and rebuild is false), otherwise embed_records + save.
// load_model, when set, runs before embedding so a model is loaded only on a cache miss.
// Throws hierarchy::InputError when a cached table does not match the record count
// or no model is available to rebuild it.
hierarchy::EmbeddingTable get_or_create_embeddings(const std::vector<hierarchy::NodeRecord>& records,
                                                   const TextEmbedder& embedder,
                                                   const EmbeddingCache& cache,
                                                   bool rebuild = false,
                                                   const ModelLoader& load_model = ModelLoader());
