#include "command_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/name_resolver.hpp>
#include <iostream>

std::optional<std::string> resolve_project(BaseCLI& cli, const Library& library,
                                           const std::string& typed) {
    ResolveOptions options;
    options.recent = cli.config->recent().recent_project;
    options.recent_enabled = cli.config->recent().enabled;
    options.autocomplete_enabled = cli.config->autocomplete().enabled;
    options.always_accept = cli.config->autocomplete().always_accept;

    auto resolved = resolve_project_name(typed, library.names(), options, cli.confirm);
    if (!resolved || resolved->empty() || !library.contains(*resolved)) {
        if (typed == RECENT_SENTINEL && options.recent_enabled) {
            std::cout << theme::fail("No recent project.");
        } else {
            std::cout << theme::fail("Project not found: " + typed);
        }
        return std::nullopt;
    }
    if (*resolved != typed && typed != RECENT_SENTINEL) {
        std::cout << theme::info("Using '" + *resolved + "'");
    }
    return resolved;
}

Result<void, platform::ProgramError> edit_file(const Profile& profile, const fs::path& path,
                                               bool wait) {
    platform::LaunchOptions options;
    options.program = profile.editor;
    options.args = {path.string()};
    options.fork_mode = wait ? false : profile.editor_fork_mode;
    return platform::launch(options);
}

int usage_error(const std::string& message, const std::string& usage) {
    std::cout << theme::fail(message);
    std::cout << theme::step("Usage: " + usage);
    return 1;
}
