#include "fastembed/commands/CommandArgs.hpp"
#include "fastembed/commands/Commands.hpp"
#include "fastembed/store/ArtifactStore.hpp"

#include <iostream>

namespace fastembed::commands {

int cmd_fetch(int argc, char** argv) {
    try {
        InitOptions opts = options_from_args(argc, argv);

        ArtifactStore store(opts.cache_dir);
        ModelArtifact a = store.resolve(opts.model, opts.show_download_progress);

        std::cout << a.local_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace fastembed::commands
