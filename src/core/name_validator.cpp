#include "name_validator.hpp"
#include "utils.hpp"
#include <array>

static const std::array<const char*, 7> SYSTEM_NAMES = {
    ".",
    "..",
    "$RECYCLE.BIN",
    "System Volume Information",
    "msdownld.tmp",
    ".Trash-1000",
    "-",   // reserved for the recent-project shortcut
};

static const std::array<const char*, 22> WINDOWS_RESERVED = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

std::string describe(NameError error) {
    switch (error) {
        case NameError::Empty:             return "project name cannot be empty";
        case NameError::InvalidCharacters: return "project name contains invalid characters";
        case NameError::DotName:           return "project name cannot be '.' or '..'";
        case NameError::SystemReserved:    return "this name is reserved by the system";
        case NameError::WindowsReserved:   return "project name cannot be a reserved name on Windows";
    }
    return "invalid project name";
}

bool is_system_name(const std::string& name) {
    for (const char* reserved : SYSTEM_NAMES) {
        if (iequals(name, reserved)) return true;
    }
    return false;
}

Result<void, NameError> validate_project_name(const std::string& name, bool windows_compat) {
    if (name.empty()) {
        return Result<void, NameError>::Err(NameError::Empty);
    }

    if (name.find_first_of("/\\:*?\"<>|") != std::string::npos) {
        return Result<void, NameError>::Err(NameError::InvalidCharacters);
    }

    if (name == "." || name == "..") {
        return Result<void, NameError>::Err(NameError::DotName);
    }

    if (is_system_name(name)) {
        return Result<void, NameError>::Err(NameError::SystemReserved);
    }

    if (windows_compat) {
        for (const char* reserved : WINDOWS_RESERVED) {
            if (iequals(name, reserved)) {
                return Result<void, NameError>::Err(NameError::WindowsReserved);
            }
        }
    }

    return Result<void, NameError>::Ok();
}
