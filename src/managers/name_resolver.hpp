#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

struct Completion {
    enum class Kind {
        Found,          // typed name is an exact entry
        FoundSimilar,   // first case-insensitive prefix match, in `suggestion`
        Nothing,
    };

    Kind kind = Kind::Nothing;
    std::string suggestion;
};

// Pure lookup: exact match first, then the first entry (in list order) that starts
// with `word`, ignoring ASCII case.
Completion suggest_completion(const std::string& word, const std::vector<std::string>& candidates);

struct ResolveOptions {
    std::string recent;               // last opened project, may be empty
    bool recent_enabled = true;
    bool autocomplete_enabled = true;
    bool always_accept = false;       // take the prefix suggestion without asking
};

// Map what the user typed onto a project name.
//   "-" with recent enabled   -> options.recent (callers treat "" as not found)
//   autocomplete enabled      -> exact match, or a confirmed prefix suggestion
//   otherwise                 -> typed, unchanged
// `confirm` is only called for prefix suggestions when always_accept is off.
std::optional<std::string> resolve_project_name(const std::string& typed,
                                                const std::vector<std::string>& known_names,
                                                const ResolveOptions& options,
                                                const ConfirmFn& confirm);
