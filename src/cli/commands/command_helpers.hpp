#pragma once

#include "../base_cli.hpp"
#include <platform/process.hpp>
#include <optional>
#include <string>

// Shared helpers used by command files (projects.cpp, templates.cpp, profiles.cpp, config.cpp)

// Map a typed name ("-", a prefix, an exact name) onto an indexed project.
// Prints the failure and returns nullopt when nothing matches.
std::optional<std::string> resolve_project(BaseCLI& cli, const Library& library,
                                           const std::string& typed);

// Open a file in the profile's editor. `wait` forces a blocking launch even for
// editors configured to run forked.
Result<void, platform::ProgramError> edit_file(const Profile& profile, const fs::path& path,
                                               bool wait);

// Usage hint after a failed argument check; always returns 1.
int usage_error(const std::string& message, const std::string& usage);
