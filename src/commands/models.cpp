#include "fastembed/commands/Commands.hpp"
#include "fastembed/core/Options.hpp"

#include <iomanip>
#include <iostream>

namespace fastembed::commands {

int cmd_models(int, char**) {
    for (const auto& m : supported_models()) {
        std::cout << std::left << std::setw(24) << m.name << std::setw(6) << m.dim << m.description;
        if (m.model == InitOptions{}.model) std::cout << " (default)";
        std::cout << "\n";
    }
    return 0;
}

} // namespace fastembed::commands
