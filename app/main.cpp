#include "fastembed/commands/Commands.hpp"

#include <iostream>
#include <string>

using namespace fastembed::commands;

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  fastembed models\n"
        << "  fastembed fetch [options]\n"
        << "  fastembed query \"<text>\" [options]\n"
        << "  fastembed embed --in <file> [options]\n"
        << "  fastembed help\n";
    return 1;
}

static int print_common_help() {
    std::cerr
        << "common options:\n"
        << "  --config <path>              JSON file with the options below\n"
        << "  --model <name>               default: fast-bge-small-en\n"
        << "  --cache <dir>                default: local_cache\n"
        << "  --max_len <n>                default: 512\n"
        << "  --providers <a,b>            onnxruntime execution providers\n"
        << "  --onnx_lib <path>            onnxruntime shared library to load\n"
        << "  --workers <n>                concurrent batches, default: one per batch\n"
        << "  --quiet                      no download progress\n";
    return 0;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  fastembed embed --in <file> [options]\n"
        << "\n"
        << "options:\n"
        << "  --in <path>                  one input per line (required)\n"
        << "  --out <path>                 default: embeddings.bin\n"
        << "  --batch <n>                  default: 512\n"
        << "  --passage                    prefix inputs with \"passage: \"\n"
        << "\n";
    return print_common_help();
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        print_usage();
        return print_common_help();
    }

    // subcommand help
    if (cmd == "embed" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_embed_help();
    if ((cmd == "fetch" || cmd == "query") && (argc >= 3 && std::string(argv[2]) == "--help")) {
        return print_common_help();
    }

    if (cmd == "models") return cmd_models(argc - 1, argv + 1);
    if (cmd == "fetch")  return cmd_fetch(argc - 1, argv + 1);
    if (cmd == "query")  return cmd_query(argc - 1, argv + 1);
    if (cmd == "embed")  return cmd_embed(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
