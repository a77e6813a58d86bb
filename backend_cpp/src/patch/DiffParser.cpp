#include "patch/DiffParser.hpp"
#include <regex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace patchwork {

Hunk DiffParser::parse_header(const std::string& line) {
    // Prefix match: a section heading may follow the closing "@@" (diff -p)
    static const std::regex header_re(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@)");
    std::smatch m;
    if (!std::regex_search(line, m, header_re)) {
        throw PatchError(ErrorKind::MalformedHunkHeader, "Invalid hunk header: " + line);
    }

    Hunk hunk;
    try {
        hunk.old_start = std::stoi(m.str(1));
        hunk.old_count = m[2].matched ? std::stoi(m.str(2)) : 1;
        hunk.new_start = std::stoi(m.str(3));
        hunk.new_count = m[4].matched ? std::stoi(m.str(4)) : 1;
    } catch (const std::out_of_range&) {
        throw PatchError(ErrorKind::MalformedHunkHeader, "Hunk header number out of range: " + line);
    }
    return hunk;
}

DiffLine DiffParser::classify(const std::string& line) {
    if (!line.empty() && line[0] == '-') return {DiffLineKind::Delete, line.substr(1)};
    if (!line.empty() && line[0] == '+') return {DiffLineKind::Insert, line.substr(1)};
    if (!line.empty() && line[0] == ' ') return {DiffLineKind::Context, line.substr(1)};
    // Empty line or unknown prefix: lenient, kept whole as context
    return {DiffLineKind::Context, line};
}

DiffSet DiffParser::parse(const std::string& diff_text) {
    std::string text = diff_text;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.pop_back();

    DiffSet hunks;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.rfind("@@", 0) == 0) {
            hunks.push_back(parse_header(line));
            continue;
        }
        if (hunks.empty()) continue; // file headers and preamble

        // "\ No newline at end of file" annotates the previous line, it is not content
        if (!line.empty() && line[0] == '\\') {
            if (!hunks.back().edits.empty()) hunks.back().edits.back().no_newline = true;
            continue;
        }

        hunks.back().edits.push_back(classify(line));
    }

    if (hunks.empty()) {
        throw PatchError(ErrorKind::EmptyDiff, "Diff contains no hunk header (@@ -a,b +c,d @@)");
    }

    for (size_t i = 0; i < hunks.size(); ++i) {
        const Hunk& h = hunks[i];
        size_t context = h.edits.size() - h.deletions() - h.insertions();
        size_t old_body = context + h.deletions();
        size_t new_body = context + h.insertions();
        if (old_body != static_cast<size_t>(h.old_count) || new_body != static_cast<size_t>(h.new_count)) {
            spdlog::warn("Hunk #{} declares -{},{} +{},{} but body has {} old / {} new lines; applying body",
                         i + 1, h.old_start, h.old_count, h.new_start, h.new_count, old_body, new_body);
        }
    }

    spdlog::debug("Parsed {} hunk(s)", hunks.size());
    return hunks;
}

} // namespace patchwork
