/**
 * Prompt helpers for interactive confirmations.
 *
 * Kept to std::cin so every command answers a yes/no question the same way.
 */
#pragma once
#include <iostream>
#include <string>

namespace servherd::cli {

struct YesNoOptions {
    bool defaultYes{false};     // What to return on enter, EOF or invalid input
    std::string yesChars{"yY"}; // Acceptable yes characters
    std::string noChars{"nN"};  // Acceptable no characters
    bool retryOnInvalid{false}; // If true, keep asking until valid
};

inline bool prompt_yes_no(const std::string& prompt, const YesNoOptions& opts = {},
                          std::ostream& out = std::cout) {
    for (;;) {
        out << prompt << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            return opts.defaultYes; // EOF -> default
        }
        if (line.empty()) {
            return opts.defaultYes;
        }
        char c = line[0];
        if (opts.yesChars.find(c) != std::string::npos)
            return true;
        if (opts.noChars.find(c) != std::string::npos)
            return false;
        if (!opts.retryOnInvalid)
            return opts.defaultYes;
    }
}

} // namespace servherd::cli
