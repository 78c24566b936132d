#include "name_resolver.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

Completion suggest_completion(const std::string& word, const std::vector<std::string>& candidates) {
    Completion result;

    if (std::find(candidates.begin(), candidates.end(), word) != candidates.end()) {
        result.kind = Completion::Kind::Found;
        result.suggestion = word;
        return result;
    }

    for (const auto& candidate : candidates) {
        if (istarts_with(candidate, word)) {
            result.kind = Completion::Kind::FoundSimilar;
            result.suggestion = candidate;
            return result;
        }
    }

    return result;
}

std::optional<std::string> resolve_project_name(const std::string& typed,
                                                const std::vector<std::string>& known_names,
                                                const ResolveOptions& options,
                                                const ConfirmFn& confirm) {
    if (typed == RECENT_SENTINEL && options.recent_enabled) {
        return options.recent;
    }

    if (!options.autocomplete_enabled) {
        return typed;
    }

    auto completion = suggest_completion(typed, known_names);
    switch (completion.kind) {
        case Completion::Kind::Found:
            return typed;
        case Completion::Kind::FoundSimilar:
            if (options.always_accept) return completion.suggestion;
            if (confirm && confirm(fmt::format("Did you mean '{}'?", completion.suggestion), true)) {
                return completion.suggestion;
            }
            return std::nullopt;
        case Completion::Kind::Nothing:
            break;
    }
    return std::nullopt;
}
