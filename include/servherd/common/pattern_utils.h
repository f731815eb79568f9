#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace servherd::common {

/**
 * constexpr, allocation-free wildcard match supporting:
 *  - '?' matches any single character
 *  - '*' matches any sequence of characters (including empty)
 *
 * Case-sensitive. '*' also crosses '/' so that command lines containing paths match
 * the way users expect (`*vite*` matches `node_modules/.bin/vite`).
 */
[[nodiscard]] inline constexpr bool wildcard_match(std::string_view text,
                                                   std::string_view pattern) noexcept {
    size_t t = 0;
    size_t p = 0;
    size_t starPos = std::string_view::npos;
    size_t matchPos = 0;

    const size_t tlen = text.size();
    const size_t plen = pattern.size();

    while (t < tlen) {
        if (p < plen && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++t;
            ++p;
        } else if (p < plen && pattern[p] == '*') {
            starPos = p++;
            matchPos = t;
        } else if (starPos != std::string_view::npos) {
            p = starPos + 1;
            ++matchPos;
            t = matchPos;
        } else {
            return false;
        }
    }

    while (p < plen && pattern[p] == '*') {
        ++p;
    }

    return p == plen;
}

/**
 * Expands shell-style brace alternatives into plain wildcard patterns.
 *
 *   "*{vite,storybook}*"  -> {"*vite*", "*storybook*"}
 *   "a{b,c{d,e}}"         -> {"ab", "acd", "ace"}
 *
 * Unbalanced braces and braces without a comma are kept literally.
 */
[[nodiscard]] inline std::vector<std::string> expand_braces(std::string_view pattern) {
    // Locate the first top-level brace group that contains a comma
    size_t open = std::string_view::npos;
    size_t close = std::string_view::npos;
    std::vector<size_t> commas;
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '{')
            continue;
        int depth = 0;
        std::vector<size_t> localCommas;
        size_t j = i;
        for (; j < pattern.size(); ++j) {
            char c = pattern[j];
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0)
                    break;
            } else if (c == ',' && depth == 1) {
                localCommas.push_back(j);
            }
        }
        if (j < pattern.size() && !localCommas.empty()) {
            open = i;
            close = j;
            commas = std::move(localCommas);
            break;
        }
    }

    if (open == std::string_view::npos) {
        return {std::string(pattern)};
    }

    std::string_view prefix = pattern.substr(0, open);
    std::string_view suffix = pattern.substr(close + 1);

    std::vector<std::string> out;
    size_t start = open + 1;
    commas.push_back(close);
    for (size_t sep : commas) {
        std::string alternative{prefix};
        alternative.append(pattern.substr(start, sep - start));
        alternative.append(suffix);
        for (auto& expanded : expand_braces(alternative)) {
            out.push_back(std::move(expanded));
        }
        start = sep + 1;
    }
    return out;
}

/**
 * Glob match with brace expansion, '*' and '?'.
 */
[[nodiscard]] inline bool glob_match(std::string_view text, std::string_view pattern) {
    for (const auto& alternative : expand_braces(pattern)) {
        if (wildcard_match(text, alternative)) {
            return true;
        }
    }
    return false;
}

} // namespace servherd::common
