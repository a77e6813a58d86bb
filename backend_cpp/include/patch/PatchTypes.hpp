#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace patchwork {

enum class ErrorKind {
    InvalidPath,
    FileNotFound,
    ReadError,
    WriteError,
    EmptyBlock,
    NoMatch,
    AmbiguousMatch,
    MalformedHunkHeader,
    EmptyDiff,
    HunkMismatch,
    HunkOutOfRange,
    HunksOutOfOrder,
    StructuralCheckFailed,
    ValidationFailed,
    MissingArgument,
    InvalidArguments
};

const char* to_string(ErrorKind kind);

// Every engine failure travels as a PatchError until PatchTransaction turns it into a PatchOutcome.
class PatchError : public std::runtime_error {
public:
    PatchError(ErrorKind kind, const std::string& message, int count = 0)
        : std::runtime_error(message), kind_(kind), count_(count) {}

    ErrorKind kind() const { return kind_; }
    // Match count for AmbiguousMatch, 1-based hunk index for hunk errors, 0 otherwise.
    int count() const { return count_; }

    PatchError& at(int line, int column) {
        line_ = line;
        column_ = column;
        return *this;
    }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    ErrorKind kind_;
    int count_;
    int line_ = 0;
    int column_ = 0;
};

struct Span {
    size_t start = 0;
    size_t end = 0;
};

struct MatchResult {
    int count = 0;
    std::optional<Span> span; // set only when count == 1
};

struct ReplaceResult {
    std::string applied_text;
    int match_count = 0;
};

enum class DiffLineKind { Context, Delete, Insert };

struct DiffLine {
    DiffLineKind kind;
    std::string text;        // without the leading marker
    bool no_newline = false; // followed by "\ No newline at end of file"
};

struct Hunk {
    int old_start = 0;
    int old_count = 1;
    int new_start = 0;
    int new_count = 1;
    std::vector<DiffLine> edits;

    size_t deletions() const;
    size_t insertions() const;
};

using DiffSet = std::vector<Hunk>;

struct Diagnostic {
    ErrorKind kind;
    std::string message;
    int line = 0;   // 1-based, 0 when unknown
    int column = 0;
    int count = 0;  // see PatchError::count()
};

struct PatchOutcome {
    bool committed = false;
    std::optional<std::string> new_text;
    std::optional<Diagnostic> diagnostic;
    int match_count = 0;

    static PatchOutcome success(std::string text, int matches) {
        PatchOutcome o;
        o.committed = true;
        o.new_text = std::move(text);
        o.match_count = matches;
        return o;
    }

    static PatchOutcome failure(Diagnostic d) {
        PatchOutcome o;
        o.diagnostic = std::move(d);
        return o;
    }
};

} // namespace patchwork
