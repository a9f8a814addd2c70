#include "matcher.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <regex>
#include <utility>

namespace wfmk {

namespace {

struct Abbreviation {
    std::regex  pattern;
    std::string replacement;
};

Abbreviation abbreviation(const std::string& word, std::string replacement) {
    return {std::regex("\\b" + word + "\\b", std::regex::icase | std::regex::ECMAScript),
            std::move(replacement)};
}

// e.g. "trinity p bp" -> "trinity Prime Blueprint", "brat*brl" -> "brat*Barrel"
const std::vector<Abbreviation>& abbreviations() {
    static const std::vector<Abbreviation> table = {
        abbreviation("brl",     "Barrel"),
        abbreviation("bld",     "Blade"),
        abbreviation("bp",      "Blueprint"),
        abbreviation("cara?",   "Carapace"),
        abbreviation("cere?",   "Cerebrum"),
        abbreviation("chas?s?", "Chassis"),
        abbreviation("gtl?t?",  "Gauntlet"),
        abbreviation("hn?dl",   "Handle"),
        abbreviation("neur?",   "Neuroptics"),
        abbreviation("p",       "Prime"),
        abbreviation("rec",     "Receiver"),
        abbreviation("scul?",   "Sculpture"),
        abbreviation("stk",     "Stock"),
        abbreviation("str",     "String"),
        abbreviation("sys",     "Systems"),
    };
    return table;
}

std::vector<std::string> matchGlob(const std::string& pattern, const ItemList& items) {
    std::vector<std::string> matches;
    for (const auto& item : items) {
        if (globMatch(pattern, item.name)) {
            matches.push_back(item.name);
        }
    }
    return matches;
}

} // namespace

std::string expandAbbreviations(const std::string& pattern) {
    std::string expanded = pattern;
    for (const auto& abbr : abbreviations()) {
        expanded = std::regex_replace(expanded, abbr.pattern, abbr.replacement);
    }
    return expanded;
}

bool globMatch(const std::string& pattern, const std::string& name) {
    return ::fnmatch(pattern.c_str(), name.c_str(), FNM_CASEFOLD) == 0;
}

std::vector<std::string> findMatchingItems(const std::string& pattern,
                                           const ItemList& items) {
    auto matches = matchGlob(pattern, items);
    if (matches.empty()) {
        matches = matchGlob(expandAbbreviations(pattern), items);
    }
    return matches;
}

MatchResult matchPatterns(const ItemList& catalog,
                          const std::vector<std::string>& patterns) {
    MatchResult result;
    for (const auto& pattern : patterns) {
        const auto matches = findMatchingItems(pattern, catalog);
        if (matches.empty()) {
            result.unmatched.push_back(pattern);
            continue;
        }
        for (const auto& name : matches) {
            if (std::find(result.names.begin(), result.names.end(), name) ==
                result.names.end()) {
                result.names.push_back(name);
            }
        }
    }
    return result;
}

} // namespace wfmk
