#include "commands/validate.hpp"

#include "emb/EmbeddingCache.hpp"
#include "emb/MiniLmEmbedder.hpp"
#include "hierarchy/CsvExport.hpp"
#include "hierarchy/MarkdownReport.hpp"
#include "hierarchy/RelationshipValidator.hpp"
#include "hierarchy/ReportArtifact.hpp"
#include "hierarchy/Summary.hpp"
#include "io/RecordsIO.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static double get_arg_double(int argc, char** argv, const std::string& key, double def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stod(s); } catch (const std::exception&) { return def; }
}

static int validate_usage() {
    std::cerr
        << "usage:\n"
        << "  hierarchy-validator validate [--data <path>] [--cache <path>] [--outdir <dir>] [options]\n"
        << "  hierarchy-validator validate --help\n";
    return 1;
}

int cmd_validate(int argc, char** argv) {
    const std::string data_path  = get_arg(argc, argv, "--data", "data/input.json");
    const std::string cache_path = get_arg(argc, argv, "--cache", "embeddings/embeddings.bin");
    const std::string model      = get_arg(argc, argv, "--model", "models/emb/model.onnx");
    const std::string vocab      = get_arg(argc, argv, "--vocab", "models/emb/vocab.txt");
    const int max_len            = get_arg_int(argc, argv, "--max_len", 256);
    const bool rebuild           = has_flag(argc, argv, "--rebuild");
    const fs::path outdir        = get_arg(argc, argv, "--outdir", "out");

    hierarchy::ValidatorConfig cfg;
    cfg.validity_threshold = (float)get_arg_double(argc, argv, "--validity_threshold", cfg.validity_threshold);
    cfg.suggestion_threshold = (float)get_arg_double(argc, argv, "--suggestion_threshold", cfg.suggestion_threshold);
    const int top_n = get_arg_int(argc, argv, "--top_n", (int)cfg.top_n);
    cfg.top_n = top_n < 0 ? 0 : (size_t)top_n;

    hierarchy::ResultFilter filter;
    const std::string status = get_arg(argc, argv, "--status", "all");
    if (!hierarchy::parse_status_filter(status, filter.status)) {
        std::cerr << "error: --status must be one of all, valid, invalid (got " << status << ")\n";
        return validate_usage();
    }
    filter.min_score = (float)get_arg_double(argc, argv, "--min_score", filter.min_score);

    try {
        const auto records = loadNodeRecords(data_path);

        // the model is only loaded when the cache is missing, unreadable or being rebuilt
        const EmbeddingCache cache(cache_path);
        MiniLmEmbedder embedder(max_len > 2 ? (size_t)max_len : 256);
        bool embedded = false;
        const hierarchy::EmbeddingTable table = get_or_create_embeddings(
            records, embedder, cache, rebuild, [&]() {
                embedded = true;
                if (!embedder.init(model, vocab)) {
                    std::cerr << "error: failed to init MiniLmEmbedder (check --model/--vocab)\n";
                    return false;
                }
                return true;
            });

        std::vector<hierarchy::Diagnostic> diags;
        const auto results = hierarchy::validate_relationships(records, table, cfg, &diags);
        const auto summary = hierarchy::summarize(results);
        const auto shown = hierarchy::filter_results(results, filter);

        hierarchy::ReportArtifact report;
        report.data_path = data_path;
        report.cache_path = cache_path;
        report.cfg = cfg;
        report.filter = filter;
        report.summary = summary;
        report.results = shown;
        report.diagnostics = diags;

        const fs::path json_path = outdir / "validation_report.json";
        const fs::path md_path = outdir / "validation_report.md";
        const fs::path current_csv = outdir / "current_relationships.csv";
        const fs::path suggestions_csv = outdir / "suggested_parents.csv";

        report.write_to(json_path);
        hierarchy::write_text(md_path, hierarchy::render_markdown_report(summary, shown));
        hierarchy::write_text(current_csv, hierarchy::render_current_csv(shown));
        hierarchy::write_text(suggestions_csv, hierarchy::render_suggestions_csv(shown));

        for (const auto& d : diags) {
            std::cerr << "warning: " << d.code << ": " << d.message;
            if (!d.root_key.empty()) std::cerr << " (root_key=" << d.root_key << ")";
            std::cerr << "\n";
        }

        std::cout << "DATA: " << data_path << "\n";
        std::cout << "CACHE: " << cache_path << (embedded ? " (rebuilt)" : "") << "\n";
        std::cout << "RECORDS: " << records.size() << "\n";
        std::cout << "RELATIONSHIPS: " << summary.total << "\n";
        std::cout << "VALID: " << summary.valid << "\n";
        std::cout << "INVALID: " << summary.invalid << "\n";
        std::cout << "PASS_RATE: " << summary.pass_rate * 100.0 << "%\n";
        std::cout << "SUGGESTIONS: " << summary.suggestion_count << "\n";
        std::cout << "AVG_IMPROVEMENT: " << summary.mean_improvement << "\n";
        std::cout << "SHOWN: " << shown.size() << " (status=" << hierarchy::status_filter_str(filter.status)
                  << ", min_score=" << filter.min_score << ")\n";
        std::cout << "WARNINGS: " << diags.size() << "\n";
        std::cout << "OUT_REPORT: " << json_path.string() << "\n";
        std::cout << "OUT_MD: " << md_path.string() << "\n";
        std::cout << "OUT_CSV: " << current_csv.string() << ", " << suggestions_csv.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "validate failed: " << e.what() << "\n";
        return 1;
    }
}
