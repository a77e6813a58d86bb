#pragma once
#include <string>
#include <vector>
#include "patch/PatchTypes.hpp"

namespace patchwork {

using LineBuffer = std::vector<std::string>; // each line keeps its own terminator

LineBuffer split_lines(const std::string& text);
std::string join_lines(const LineBuffer& lines);
// "\r\n" when the first terminated line uses it, "\n" otherwise.
std::string detect_eol(const LineBuffer& lines);

struct ApplyOptions {
    bool verify_context = false; // context lines must equal the buffer
    bool check_order = false;    // reject hunks whose old_start decreases
};

class HunkApplier {
public:
    explicit HunkApplier(ApplyOptions options = {}) : options_(options) {}

    // Applies hunks in the given order. Each declared old_start is in original
    // coordinates and is shifted by the running (insertions - deletions) of the
    // hunks before it. Throws HunkMismatch, HunkOutOfRange, HunksOutOfOrder.
    LineBuffer apply(const LineBuffer& original, const DiffSet& hunks) const;

    std::string apply(const std::string& original, const DiffSet& hunks) const {
        return join_lines(apply(split_lines(original), hunks));
    }

private:
    ApplyOptions options_;

    void check_ascending(const DiffSet& hunks) const;
    static bool same_line(const std::string& buffer_line, const std::string& diff_text);
};

} // namespace patchwork
