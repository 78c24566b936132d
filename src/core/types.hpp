#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <filesystem>
#include <utility>

// Result type for operations that can fail.
// E defaults to a plain message; components with a closed error set pass their own type.
template <typename T, typename E = std::string>
struct Result {
    bool success;
    T value;
    E error;

    static Result<T, E> Ok(T val) {
        return {true, std::move(val), E{}};
    }

    static Result<T, E> Err(E err) {
        return {false, T{}, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <typename E>
struct Result<void, E> {
    bool success;
    E error;

    static Result<void, E> Ok() {
        return {true, E{}};
    }

    static Result<void, E> Err(E err) {
        return {false, std::move(err)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One managed directory. A view owned by the Library, not a resource of its own.
struct Project {
    std::string name;
    std::filesystem::path path;
};

// Editor/shell bundle used to open or provision projects.
struct Profile {
    std::string editor;
    std::vector<std::string> editor_args;
    bool editor_fork_mode = false;
    std::string shell;
    std::vector<std::string> shell_args;
};

// Named, ordered list of shell commands.
struct Template {
    std::string name;
    std::vector<std::string> commands;
};

// Yes/no prompt: (question, default answer) -> answer
using ConfirmFn = std::function<bool(const std::string&, bool)>;
