#include "patch/Matcher.hpp"

namespace patchwork {

std::string normalize_indentation(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\t') out.append(Matcher::kTabWidth, ' ');
        else out += c;
    }
    return out;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n\v\f";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

MatchResult Matcher::find(const std::string& document, const std::string& block) {
    std::string needle = normalize_indentation(trim(block));
    if (needle.empty()) {
        throw PatchError(ErrorKind::EmptyBlock, "Search block cannot be empty");
    }
    std::string haystack = normalize_indentation(document);

    MatchResult result;
    size_t first_hit = std::string::npos;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        if (result.count == 0) first_hit = pos;
        result.count++;
        pos = haystack.find(needle, pos + 1);
    }

    if (result.count == 1) {
        result.span = Span{first_hit, first_hit + needle.size()};
    }
    return result;
}

Span Matcher::to_original(const std::string& original, const Span& normalized) {
    Span out{original.size(), original.size()};
    bool start_set = false;
    size_t col = 0; // position in normalized coordinates
    for (size_t i = 0; i < original.size(); ++i) {
        size_t width = (original[i] == '\t') ? kTabWidth : 1;
        if (!start_set && normalized.start < col + width) {
            out.start = i;
            start_set = true;
        }
        if (normalized.end <= col) {
            out.end = i;
            return out;
        }
        col += width;
    }
    if (!start_set) out.start = original.size();
    return out;
}

} // namespace patchwork
