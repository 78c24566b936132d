#include <iostream>
#include "cli/kanri_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        KanriCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
