#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_project_commands(BaseCLI& cli);
void register_template_commands(BaseCLI& cli);
void register_profile_commands(BaseCLI& cli);
void register_config_commands(BaseCLI& cli);

class KanriCLI : public BaseCLI {
public:
    KanriCLI();

    // argv[1] is the command, the rest its arguments.
    int run(int argc, char** argv);
    void print_usage() const;

private:
    void register_all_commands();
};
