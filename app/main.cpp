#include "commands/recordsDump.hpp"
#include "commands/embed.hpp"
#include "commands/validate.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  hierarchy-validator records dump [path]\n"
        << "  hierarchy-validator embed [args]\n"
        << "  hierarchy-validator validate [args]\n"
        << "  hierarchy-validator help\n";
    return 1;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  hierarchy-validator embed [options]\n"
        << "\n"
        << "options:\n"
        << "  --data <path>                default: data/input.json\n"
        << "  --cache <path>               default: embeddings/embeddings.bin\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n";
    return 0;
}

static int print_validate_help() {
    std::cerr
        << "usage:\n"
        << "  hierarchy-validator validate [options]\n"
        << "\n"
        << "inputs/outputs:\n"
        << "  --data <path>                default: data/input.json\n"
        << "  --cache <path>               default: embeddings/embeddings.bin\n"
        << "  --outdir <dir>               default: out\n"
        << "\n"
        << "embeddings (only used when the cache is missing or --rebuild):\n"
        << "  --model <path>               default: models/emb/model.onnx\n"
        << "  --vocab <path>               default: models/emb/vocab.txt\n"
        << "  --max_len <n>                default: 256\n"
        << "  --rebuild                    ignore and overwrite the cache\n"
        << "\n"
        << "validation:\n"
        << "  --validity_threshold <f>     default: 0.65\n"
        << "  --suggestion_threshold <f>   default: 0.65\n"
        << "  --top_n <n>                  default: 3\n"
        << "\n"
        << "report filter:\n"
        << "  --status <all|valid|invalid> default: all\n"
        << "  --min_score <f>              default: 0.0\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "records") {
        if (argc >= 3 && std::string(argv[2]) == "dump") {
            const std::string path = (argc >= 4) ? argv[3] : "data/input.json";
            return recordsDump(path);
        }
        return print_usage();
    }

    // subcommand help
    if (cmd == "embed"    && (argc >= 3 && std::string(argv[2]) == "--help")) return print_embed_help();
    if (cmd == "validate" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_validate_help();

    if (cmd == "embed")    return cmd_embed(argc - 1, argv + 1);
    if (cmd == "validate") return cmd_validate(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
