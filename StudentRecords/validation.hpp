#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <iostream>
#include <cstdint>
#include <limits>
#include <cctype>   // for std::isspace, std::isdigit

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - parse_student_id: text -> positive 64-bit id (the InvalidId boundary).
  - Validators: non-empty text, short non-empty text, email.
  - Prompt helpers for interactive console:
      * prompt_until_valid_or_back    -> loop until validator passes
      * prompt_id_or_back             -> positive integer id, re-prompts
      * prompt_edit_string            -> edit in-place with default value
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
  - End of input is treated as Exit so a closed stdin never spins.
  - Prompts read from / write to the given streams (std::cin / std::cout by
    default).
  - All characters are plain ASCII (no Unicode dashes).
-------------------------------------------------------------------------------
*/

// Trim leading and trailing whitespace.
inline std::string trim(std::string s) {
    auto ws = [](unsigned char ch) { return std::isspace(ch) != 0; };
    s.erase(s.begin(), std::find_if_not(s.begin(), s.end(), ws));
    s.erase(std::find_if_not(s.rbegin(), s.rend(), ws).base(), s.end());
    return s;
}

// Digits only, value in [1, INT64_MAX] (the SQLite rowid range). Surrounding
// whitespace is ignored; signs, embedded spaces, trailing junk and overflow
// are rejected. `out` is only written on success.
inline bool parse_student_id(const std::string& text, std::int64_t& out) {
    const std::string t = trim(text);
    if (t.empty()) return false;
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    std::int64_t v = 0;
    for (char ch : t) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
        const int d = ch - '0';
        if (v > (max - d) / 10) return false;
        v = v * 10 + d;
    }
    if (v < 1) return false;
    out = v;
    return true;
}

inline bool is_non_empty(const std::string& x) {
    return !trim(x).empty();
}

// non-empty, max 60
inline bool is_non_empty_short(const std::string& x) {
    return is_non_empty(x) && x.size() <= 60;
}

// local@domain.tld, no spaces, max 254
inline bool is_valid_email(const std::string& x) {
    if (x.size() > 254) return false;
    static const std::regex re("^[A-Za-z0-9._%+\\-]+@[A-Za-z0-9\\-]+(\\.[A-Za-z0-9\\-]+)*\\.[A-Za-z]{2,}$");
    return std::regex_match(x, re);
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

inline bool is_back(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// String prompt that accepts Back/Exit keywords.
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        std::string v;
        os << label << " (0=Back, x=Exit): ";
        if (!std::getline(in, v)) return InputCtl::Exit;
        v = trim(v);
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        os << "  -> " << error_msg << "\n";
    }
}

// Id prompt: re-prompts until the text parses as a positive integer.
inline InputCtl prompt_id_or_back(
    const std::string& label,
    std::int64_t& out,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        std::string v;
        os << label << " (b=Back, x=Exit): ";
        if (!std::getline(in, v)) return InputCtl::Exit;
        v = trim(v);
        if (v == "b" || v == "B") return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (parse_student_id(v, out)) return InputCtl::Ok;
        os << "  -> Invalid ID. Must be a positive whole number.\n";
    }
}

// Edit-friendly prompt: show current value, Enter = keep,
// 0/b = Back, x/q = Exit, otherwise validate new value.
inline InputCtl prompt_edit_string(
    const std::string& label,
    const std::string& current,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        os << label << " [" << current << "] (Enter=keep, 0=Back, x=Exit): ";
        std::string v;
        if (!std::getline(in, v)) return InputCtl::Exit;
        v = trim(v);
        if (v.empty()) { out = current; return InputCtl::Ok; }
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        os << "  -> " << error_msg << "\n";
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(
    const std::string& msg,
    std::istream& in = std::cin,
    std::ostream& os = std::cout)
{
    for (;;) {
        std::string v;
        os << msg << " [y/N] (0=Back, x=Exit): ";
        if (!std::getline(in, v)) return InputCtl::Exit;
        v = trim(v);
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        os << "  -> Please enter y or n.\n";
    }
}
