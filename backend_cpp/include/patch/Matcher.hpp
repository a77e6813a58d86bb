#pragma once
#include <string>
#include "patch/PatchTypes.hpp"

namespace patchwork {

// Tabs become exactly four spaces. Nothing else is collapsed.
std::string normalize_indentation(const std::string& text);

// Leading/trailing whitespace stripped (space, tab, CR, LF, VT, FF).
std::string trim(const std::string& text);

class Matcher {
public:
    static constexpr size_t kTabWidth = 4;

    // Counts occurrences of the normalized block in the normalized document.
    // The scan resumes one character past the start of each hit, so overlapping
    // occurrences ("aa" in "aaa") count separately. That count is what decides ambiguity.
    static MatchResult find(const std::string& document, const std::string& block);

    // Maps a span over normalize_indentation(original) back onto original.
    // A start inside a tab expansion snaps to the tab; an end inside one extends past it.
    static Span to_original(const std::string& original, const Span& normalized);
};

} // namespace patchwork
