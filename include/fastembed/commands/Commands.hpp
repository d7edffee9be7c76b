#pragma once

namespace fastembed::commands {

int cmd_models(int argc, char** argv);
int cmd_fetch(int argc, char** argv);
int cmd_query(int argc, char** argv);
int cmd_embed(int argc, char** argv);

} // namespace fastembed::commands
