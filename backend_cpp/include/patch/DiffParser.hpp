#pragma once
#include <string>
#include "patch/PatchTypes.hpp"

namespace patchwork {

class DiffParser {
public:
    // Parses unified-diff text into hunks in input order.
    // Lines before the first "@@" (---, +++, diff --git, index) are skipped.
    // Throws MalformedHunkHeader or EmptyDiff.
    static DiffSet parse(const std::string& diff_text);

    // "@@ -<oldStart>[,<oldCount>] +<newStart>[,<newCount>] @@", counts default to 1.
    static Hunk parse_header(const std::string& line);

    // '-' delete, '+' insert, anything else (' ', empty, unknown) is context.
    static DiffLine classify(const std::string& line);
};

} // namespace patchwork
