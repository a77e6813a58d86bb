#include "patch/ReplaceEngine.hpp"
#include "patch/Matcher.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace patchwork {

std::string ReplaceEngine::reindent(const std::string& block, const std::string& indent) {
    if (indent.empty()) return block;
    std::string out;
    std::istringstream stream(block);
    std::string line;
    bool first = true;
    while (std::getline(stream, line)) {
        if (!first) out += '\n';
        out += indent + line;
        first = false;
    }
    return out;
}

std::string ReplaceEngine::replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

ReplaceResult ReplaceEngine::replace(const std::string& document,
                                     const std::string& search,
                                     const std::string& replacement,
                                     bool strict) {
    std::string needle = trim(search);
    if (needle.empty()) {
        throw PatchError(ErrorKind::EmptyBlock, "Search block cannot be empty");
    }
    std::string body = trim(replacement);

    MatchResult match = Matcher::find(document, needle);

    if (match.count == 0) {
        throw PatchError(ErrorKind::NoMatch,
                         "Search block not found in file. Make sure you're searching for an exact code snippet that exists in the file.");
    }

    if (match.count > 1) {
        if (strict) {
            throw PatchError(ErrorKind::AmbiguousMatch,
                             "Found " + std::to_string(match.count) + " matches for search block. "
                             "Please provide more context to make the search unique. "
                             "You can include more surrounding code or distinctive elements to ensure exactly 1 match.",
                             match.count);
        }
        // Permissive: global substitution on the normalized text, replacement inserted as-is.
        spdlog::debug("Permissive replace across {} occurrences", match.count);
        std::string updated = replace_all(normalize_indentation(document),
                                          normalize_indentation(needle), body);
        return {updated, match.count};
    }

    Span span = Matcher::to_original(document, *match.span);
    std::string matched = document.substr(span.start, span.end - span.start);

    // Leading whitespace of the matched text on its first line
    std::string indent = matched.substr(0, std::min(matched.find_first_not_of(" \t"), matched.size()));

    std::string updated = document.substr(0, span.start) + reindent(body, indent) + document.substr(span.end);
    return {updated, 1};
}

void ReplaceEngine::verify(const std::string& original,
                           const std::string& updated,
                           const std::string& search,
                           const std::string& replacement) {
    if (original == updated) {
        throw PatchError(ErrorKind::StructuralCheckFailed,
                         "Replacement did not take effect: content is unchanged");
    }

    std::string normalized = normalize_indentation(updated);
    if (normalized.find(normalize_indentation(trim(search))) != std::string::npos) {
        throw PatchError(ErrorKind::StructuralCheckFailed,
                         "Replacement did not take effect: search block still present after replacement");
    }

    std::string wanted = normalize_indentation(trim(replacement));
    if (normalized.find(wanted) == std::string::npos) {
        throw PatchError(ErrorKind::StructuralCheckFailed,
                         "Replacement did not take effect: replace block not found in result. Check indentation and formatting.");
    }
}

} // namespace patchwork
