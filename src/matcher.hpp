#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace wfmk {

/// Expand standalone abbreviations ("p" -> "Prime", "bp" -> "Blueprint", ...).
std::string expandAbbreviations(const std::string& pattern);

/// Case-insensitive glob match (*, ?, [...], [!...]) of @p name.
bool globMatch(const std::string& pattern, const std::string& name);

/// Names of @p items matching @p pattern, in catalog order. If nothing
/// matches, retries once with abbreviations expanded.
std::vector<std::string> findMatchingItems(const std::string& pattern,
                                           const ItemList& items);

struct MatchResult {
    std::vector<std::string> names;      // de-duplicated, first-seen order
    std::vector<std::string> unmatched;  // patterns that found nothing
};

MatchResult matchPatterns(const ItemList& catalog,
                          const std::vector<std::string>& patterns);

} // namespace wfmk
