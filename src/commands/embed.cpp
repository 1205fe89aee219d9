#include "commands/embed.hpp"
#include "emb/EmbeddingCache.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "io/RecordsIO.hpp"
#include <iostream>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static size_t count_present(const std::vector<hierarchy::Embedding>& vecs) {
    size_t n = 0;
    for (const auto& v : vecs) if (!v.empty()) ++n;
    return n;
}

int cmd_embed(int argc, char** argv) {
    const std::string data  = get_arg(argc, argv, "--data", "data/input.json");
    const std::string cache = get_arg(argc, argv, "--cache", "embeddings/embeddings.bin");
    const std::string model = get_arg(argc, argv, "--model", "models/emb/model.onnx");
    const std::string vocab = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");
    const int max_len       = get_arg_int(argc, argv, "--max_len", 256);

    try {
        const auto records = loadNodeRecords(data);

        MiniLmEmbedder emb(max_len > 2 ? (size_t)max_len : 256);
        if (!emb.init(model, vocab)) {
            std::cerr << "error: failed to init MiniLmEmbedder\n";
            return 1;
        }

        const hierarchy::EmbeddingTable table = embed_records(records, emb);

        const EmbeddingCache out(cache);
        if (!out.save(table)) {
            std::cerr << "error: failed to save embeddings to " << cache << "\n";
            return 1;
        }

        std::cout << "DATA: " << data << "\n";
        std::cout << "RECORDS: " << records.size() << "\n";
        std::cout << "ROOT_VECTORS: " << count_present(table.root) << "\n";
        std::cout << "PARENT_VECTORS: " << count_present(table.parent) << "\n";
        std::cout << "OUT_CACHE: " << cache << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "embed failed: " << e.what() << "\n";
        return 1;
    }
}
