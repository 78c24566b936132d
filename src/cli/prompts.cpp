#include "prompts.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

// Readline uses \001 and \002 to wrap non-printing chars so it can
// compute the visible prompt width correctly for cursor positioning.
static std::string rl_esc(const std::string& code) {
    if (code.empty()) return code;
    return std::string("\001") + code + std::string("\002");
}

// Returns false on EOF (Ctrl-D).
static bool read_line(const std::string& prompt, std::string& out) {
    char* raw = readline(prompt.c_str());
    if (!raw) return false;
    out = raw;
    free(raw);
    return true;
}

bool parse_answer(const std::string& reply, bool default_answer) {
    std::string r = reply;
    trim(r);
    r = to_lower(r);
    if (r == "y" || r == "yes") return true;
    if (r == "n" || r == "no") return false;
    return default_answer;
}

bool ask_dialog(const std::string& question, bool default_answer) {
    std::string prompt = rl_esc(theme::color::BROWN) + "    " + question
                       + (default_answer ? " [Y/n] " : " [y/N] ")
                       + rl_esc(theme::color::RESET);
    std::string reply;
    if (!read_line(prompt, reply)) return default_answer;
    return parse_answer(reply, default_answer);
}

std::string ask_string(const std::string& label, const std::string& default_val) {
    std::string suffix = default_val.empty() ? ": " : " [" + default_val + "]: ";
    std::string prompt = rl_esc(theme::color::BROWN) + "    " + label + suffix
                       + rl_esc(theme::color::RESET);
    std::string answer;
    if (!read_line(prompt, answer)) return default_val;
    trim(answer);
    if (answer.empty()) return default_val;
    add_history(answer.c_str());
    return answer;
}
