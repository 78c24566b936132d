#pragma once

#include <string>
#include <platform/platform.hpp>
#include "types.hpp"

enum class NameError {
    Empty,
    InvalidCharacters,   // one of / \ : * ? " < > |
    DotName,             // "." or ".."
    SystemReserved,      // recycle bin, volume metadata, trash, "-"
    WindowsReserved,     // CON, PRN, AUX, NUL, COM1-9, LPT1-9
};

std::string describe(NameError error);

// True if the name belongs to the system-directory exclusion set (case-insensitive).
// These entries are never listed as projects and never accepted as new names.
bool is_system_name(const std::string& name);

// Check that a name may be used for a new project directory.
// windows_compat additionally rejects the reserved DOS device names.
Result<void, NameError> validate_project_name(const std::string& name,
                                              bool windows_compat = platform::kWindowsHost);
