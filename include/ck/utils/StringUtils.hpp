#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "ck/core/Error.hpp"

namespace ck::utils {

std::string ToLowerCopy(std::string value);

// True for "true", "yes" and "y" in any case; every other string is false.
bool StrToBool(std::string_view value);

/**
 * @brief Splits @p text into maximal runs of word characters.
 *
 * Word characters are ASCII letters, digits, '_' and '\''. Everything else
 * separates words and is dropped.
 */
std::vector<std::string> SplitWords(std::string_view text);

/**
 * @brief Checks @p value against a set of options.
 * @param exactMatch   Require equality; otherwise @p value may be a substring of an option.
 * @param caseSensitive Compare as-is; otherwise both sides are lower-cased first.
 */
bool MatchesAnyOption(std::string_view value,
                      const std::vector<std::string>& options,
                      bool caseSensitive,
                      bool exactMatch);

/**
 * @brief Swaps keys and values.
 * @throws ck::core::InvariantViolationError if two keys map to the same value.
 */
template <typename K, typename V>
std::map<V, K> InvertMapping(const std::map<K, V>& mapping) {
    std::map<V, K> inverted;
    for (const auto& [key, value] : mapping) {
        auto [it, inserted] = inverted.emplace(value, key);
        if (!inserted) {
            throw ck::core::InvariantViolationError(
                "mapping inversion",
                fmt::format("value '{}' is shared by keys '{}' and '{}'", value, it->second, key));
        }
    }
    return inverted;
}

} // namespace ck::utils
