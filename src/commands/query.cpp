#include "fastembed/EmbeddingService.hpp"
#include "fastembed/commands/CommandArgs.hpp"
#include "fastembed/commands/Commands.hpp"

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace fastembed::commands {

int cmd_query(int argc, char** argv) {
    if (argc < 2 || std::string(argv[1]).rfind("--", 0) == 0) {
        std::cerr << "error: query needs the text as its first argument\n";
        return 1;
    }
    const std::string text = argv[1];

    try {
        EmbeddingService service(options_from_args(argc, argv));
        Embedding v = service.query_embed(text);
        service.destroy();

        std::cout << nlohmann::json(v).dump() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace fastembed::commands
