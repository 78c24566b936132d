#include "kanri_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

KanriCLI::KanriCLI() : BaseCLI() {
    register_all_commands();
}

void KanriCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::vector<std::string>&) {
        this->print_usage();
        return 0;
    }, "Show this help message");

    add_command("zen", [](BaseCLI&, const std::vector<std::string>&) {
        std::cout << theme::zen();
        return 0;
    }, "Print the zen of kanri");

    register_project_commands(*this);
    register_template_commands(*this);
    register_profile_commands(*this);
    register_config_commands(*this);
}

void KanriCLI::print_usage() const {
    std::cout << theme::banner(KANRI_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    kanri "
              << theme::color::RESET << theme::color::BROWN << "<command> [args]"
              << theme::color::RESET << "\n";
    print_help();
    std::cout << theme::color::DIM
              << "    '-' stands for the most recently opened project.\n"
              << "    kanri --version       Show version\n"
              << "    kanri --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int KanriCLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    std::string cmd = argv[1];
    if (cmd == "--version" || cmd == "-V") {
        std::cout << theme::color::BROWN << theme::color::BOLD << "kanri"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << KANRI_VERSION << theme::color::RESET << "\n";
        return 0;
    }
    if (cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    return execute_command(cmd, args);
}
