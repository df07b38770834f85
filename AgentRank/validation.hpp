#pragma once
#include <string>
#include <algorithm>
#include <iostream>
#include <cctype>   // for std::isspace
#include <iterator>
#include "models.hpp"
#include "errors.hpp"

/*
-------------------------------------------------------------------------------
 validation.hpp - Profile validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - trim: basic whitespace trimming helper.
  - Validators: one per closed value set of a CustomerProfile, plus the
    customer name rule (and a length-capped variant for console entry).
  - validate_profile: throws ValidationError naming the first bad field.
  - Prompt helpers for interactive console:
      * prompt_until_valid_or_back    -> loop until validator passes, Back/Exit
      * prompt_choice_or_back         -> pick one entry of a closed value set

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
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

// Exact, case-sensitive membership in a closed value set.
template <typename Set>
inline bool in_set(const Set& values, const std::string& x) {
    return std::any_of(std::begin(values), std::end(values),
        [&](const char* v) { return x == v; });
}

inline bool is_valid_communication_method(const std::string& x) { return in_set(kCommunicationMethods, x); }
inline bool is_valid_lead_source(const std::string& x) { return in_set(kLeadSources, x); }
inline bool is_valid_destination(const std::string& x) { return in_set(kDestinations, x); }
inline bool is_valid_launch_location(const std::string& x) { return in_set(kLaunchLocations, x); }

// non-empty after trimming
inline bool is_valid_customer_name(const std::string& x) {
    return !trim(x).empty();
}

// console entry only: also keeps the name to one table row, max 80
inline bool is_valid_customer_name_entry(const std::string& x) {
    return is_valid_customer_name(x) && trim(x).size() <= 80;
}

// Reject a profile that the calling layer should never have let through.
inline void validate_profile(const CustomerProfile& p) {
    if (!is_valid_customer_name(p.customer_name))
        throw ValidationError("customer_name must be non-empty");
    if (!is_valid_communication_method(p.communication_method))
        throw ValidationError("unknown communication_method '" + p.communication_method + "'");
    if (!is_valid_lead_source(p.lead_source))
        throw ValidationError("unknown lead_source '" + p.lead_source + "'");
    if (!is_valid_destination(p.destination))
        throw ValidationError("unknown destination '" + p.destination + "'");
    if (!is_valid_launch_location(p.launch_location))
        throw ValidationError("unknown launch_location '" + p.launch_location + "'");
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

inline bool is_back(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

// Read one trimmed line; false on end of input.
inline bool read_line(std::istream& in, std::string& v) {
    if (!std::getline(in >> std::ws, v)) return false;
    v = trim(v);
    return true;
}

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg,
    std::istream& in = std::cin)
{
    for (;;) {
        std::string v;
        std::cout << label << " (0=Back, x=Exit): ";
        if (!read_line(in, v)) return InputCtl::Exit;
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Numbered menu over a closed value set. Accepts the number or the exact text.
template <typename Set>
inline InputCtl prompt_choice_or_back(
    const std::string& label,
    const Set& values,
    std::string& out,
    std::istream& in = std::cin)
{
    for (;;) {
        std::cout << label << ":\n";
        int i = 1;
        for (const char* v : values) std::cout << "  [" << i++ << "] " << v << "\n";
        std::cout << "  CHOICE (0=Back, x=Exit): ";

        std::string v;
        if (!read_line(in, v)) return InputCtl::Exit;
        if (is_back(v)) return InputCtl::Back;
        if (is_exit(v)) return InputCtl::Exit;
        if (in_set(values, v)) { out = v; return InputCtl::Ok; }

        const bool numeric = !v.empty() && std::all_of(v.begin(), v.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; });
        if (numeric && v.size() < 4) {
            const int n = std::stoi(v);
            if (n >= 1 && n <= static_cast<int>(std::size(values))) {
                out = values[static_cast<std::size_t>(n - 1)];
                return InputCtl::Ok;
            }
        }
        std::cout << "  -> Pick a number from the list.\n";
    }
}
