#pragma once

#include <string>

// ── Interactive prompt helpers (GNU readline) ───────────

// Yes/no question. Empty input or EOF returns default_answer.
bool ask_dialog(const std::string& question, bool default_answer);

// Free-form line. Empty input or EOF returns default_val.
std::string ask_string(const std::string& label, const std::string& default_val = "");

// Parses a yes/no reply. Anything unrecognized yields default_answer.
bool parse_answer(const std::string& reply, bool default_answer);
