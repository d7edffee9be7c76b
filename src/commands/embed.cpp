#include "fastembed/EmbeddingService.hpp"
#include "fastembed/commands/CommandArgs.hpp"
#include "fastembed/commands/Commands.hpp"
#include "fastembed/core/Errors.hpp"
#include "fastembed/store/EmbeddingFile.hpp"

#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

namespace fastembed::commands {

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw FilesystemError("failed to open: " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        lines.push_back(line);
    }
    return lines;
}

int cmd_embed(int argc, char** argv) {
    std::string inp  = get_arg(argc, argv, "--in", "");
    std::string outp = get_arg(argc, argv, "--out", "embeddings.bin");
    std::string batch = get_arg(argc, argv, "--batch", "0");
    bool passage = has_flag(argc, argv, "--passage");

    if (inp.empty()) {
        std::cerr << "error: --in <file> is required\n";
        return 1;
    }

    try {
        std::vector<std::string> texts = read_lines(inp);
        int batch_size = (int)parse_count("--batch", batch, (size_t)std::numeric_limits<int>::max());

        EmbeddingService service(options_from_args(argc, argv));
        std::vector<Embedding> vecs = passage ? service.passage_embed(texts, batch_size)
                                              : service.embed(texts, batch_size);
        service.destroy();

        EmbeddingFile file;
        file.set(std::move(texts), vecs);
        file.save(outp);

        std::cout << "saved: " << outp << " (n=" << file.size() << ", dim=" << file.dim() << ")\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace fastembed::commands
