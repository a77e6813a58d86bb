#include "patch/HunkApplier.hpp"
#include <spdlog/spdlog.h>

namespace patchwork {

LineBuffer split_lines(const std::string& text) {
    LineBuffer lines;
    size_t begin = 0;
    while (begin < text.size()) {
        size_t nl = text.find('\n', begin);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, nl - begin + 1));
        begin = nl + 1;
    }
    return lines;
}

std::string join_lines(const LineBuffer& lines) {
    std::string out;
    for (const auto& l : lines) out += l;
    return out;
}

std::string detect_eol(const LineBuffer& lines) {
    for (const auto& l : lines) {
        if (!l.empty() && l.back() == '\n') {
            return (l.size() >= 2 && l[l.size() - 2] == '\r') ? "\r\n" : "\n";
        }
    }
    return "\n";
}

bool HunkApplier::same_line(const std::string& buffer_line, const std::string& diff_text) {
    size_t len = buffer_line.size();
    if (len > 0 && buffer_line[len - 1] == '\n') --len;
    if (len > 0 && buffer_line[len - 1] == '\r') --len;
    return buffer_line.compare(0, len, diff_text) == 0 && diff_text.size() == len;
}

void HunkApplier::check_ascending(const DiffSet& hunks) const {
    for (size_t i = 1; i < hunks.size(); ++i) {
        if (hunks[i].old_start < hunks[i - 1].old_start) {
            throw PatchError(ErrorKind::HunksOutOfOrder,
                             "Hunk #" + std::to_string(i + 1) + " starts at line " +
                             std::to_string(hunks[i].old_start) + ", before hunk #" + std::to_string(i) +
                             " at line " + std::to_string(hunks[i - 1].old_start) +
                             ". Hunks must be in ascending order.",
                             static_cast<int>(i + 1));
        }
    }
}

LineBuffer HunkApplier::apply(const LineBuffer& original, const DiffSet& hunks) const {
    if (options_.check_order) check_ascending(hunks);

    LineBuffer buffer = original;
    const std::string eol = detect_eol(original);
    long offset = 0;

    for (size_t h = 0; h < hunks.size(); ++h) {
        const Hunk& hunk = hunks[h];
        const int number = static_cast<int>(h + 1);

        // 1-based declared start; a zero-count hunk sits after its line, -0,0 at the top
        long base = hunk.old_start - 1;
        if (hunk.old_start == 0) base = 0;
        else if (hunk.old_count == 0) base = hunk.old_start;

        long actual_start = base + offset;
        if (actual_start < 0 || actual_start > static_cast<long>(buffer.size())) {
            throw PatchError(ErrorKind::HunkOutOfRange,
                             "Hunk #" + std::to_string(number) + " starts at line " +
                             std::to_string(actual_start + 1) + " but the file has " +
                             std::to_string(buffer.size()) + " lines",
                             number);
        }

        spdlog::debug("Hunk #{}: declared -{},{} -> buffer line {} (offset {:+})",
                      number, hunk.old_start, hunk.old_count, actual_start + 1, offset);

        size_t cursor = static_cast<size_t>(actual_start);
        long inserted = 0, deleted = 0;
        for (const auto& edit : hunk.edits) {
            switch (edit.kind) {
                case DiffLineKind::Context:
                    if (cursor >= buffer.size()) {
                        if (options_.verify_context) {
                            throw PatchError(ErrorKind::HunkOutOfRange,
                                             "Hunk #" + std::to_string(number) +
                                             " context runs past end of file: '" + edit.text + "'",
                                             number);
                        }
                        break;
                    }
                    if (options_.verify_context && !same_line(buffer[cursor], edit.text)) {
                        throw PatchError(ErrorKind::HunkMismatch,
                                         "Hunk #" + std::to_string(number) + " context mismatch at line " +
                                         std::to_string(cursor + 1) + ": expected '" + edit.text + "'",
                                         number);
                    }
                    ++cursor;
                    break;

                case DiffLineKind::Delete:
                    if (cursor >= buffer.size()) {
                        throw PatchError(ErrorKind::HunkOutOfRange,
                                         "Hunk #" + std::to_string(number) +
                                         " deletes past end of file: '" + edit.text + "'",
                                         number);
                    }
                    if (!same_line(buffer[cursor], edit.text)) {
                        throw PatchError(ErrorKind::HunkMismatch,
                                         "Hunk #" + std::to_string(number) + " cannot delete line " +
                                         std::to_string(cursor + 1) + ": expected '" + edit.text +
                                         "'. The file may already be patched or has changed.",
                                         number);
                    }
                    buffer.erase(buffer.begin() + static_cast<long>(cursor));
                    ++deleted;
                    break;

                case DiffLineKind::Insert:
                    buffer.insert(buffer.begin() + static_cast<long>(cursor),
                                  edit.no_newline ? edit.text : edit.text + eol);
                    ++cursor;
                    ++inserted;
                    break;
            }
        }

        offset += inserted - deleted;
    }

    // A line that lost its "last line" status needs a terminator; only the last may go without
    for (size_t i = 0; i + 1 < buffer.size(); ++i) {
        if (buffer[i].empty() || buffer[i].back() != '\n') buffer[i] += eol;
    }
    return buffer;
}

} // namespace patchwork
