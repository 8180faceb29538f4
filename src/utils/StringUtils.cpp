#include "ck/utils/StringUtils.hpp"

#include <algorithm>
#include <cctype>

namespace ck::utils {

namespace {

bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c == '\'';
}

} // namespace

std::string ToLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool StrToBool(std::string_view value) {
    const std::string lowered = ToLowerCopy(std::string(value));
    return lowered == "true" || lowered == "yes" || lowered == "y";
}

std::vector<std::string> SplitWords(std::string_view text) {
    std::vector<std::string> words;
    std::size_t start = 0;
    while (start < text.size()) {
        while (start < text.size() && !IsWordChar(static_cast<unsigned char>(text[start]))) {
            ++start;
        }
        std::size_t end = start;
        while (end < text.size() && IsWordChar(static_cast<unsigned char>(text[end]))) {
            ++end;
        }
        if (end > start) {
            words.emplace_back(text.substr(start, end - start));
        }
        start = end;
    }
    return words;
}

bool MatchesAnyOption(std::string_view value,
                      const std::vector<std::string>& options,
                      bool caseSensitive,
                      bool exactMatch) {
    const std::string needle = caseSensitive ? std::string(value) : ToLowerCopy(std::string(value));
    return std::any_of(options.begin(), options.end(), [&](const std::string& option) {
        const std::string candidate = caseSensitive ? option : ToLowerCopy(option);
        if (exactMatch) {
            return candidate == needle;
        }
        return candidate.find(needle) != std::string::npos;
    });
}

} // namespace ck::utils
