#include "patch/PatchTypes.hpp"
#include <algorithm>

namespace patchwork {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidPath: return "InvalidPath";
        case ErrorKind::FileNotFound: return "FileNotFound";
        case ErrorKind::ReadError: return "ReadError";
        case ErrorKind::WriteError: return "WriteError";
        case ErrorKind::EmptyBlock: return "EmptyBlock";
        case ErrorKind::NoMatch: return "NoMatch";
        case ErrorKind::AmbiguousMatch: return "AmbiguousMatch";
        case ErrorKind::MalformedHunkHeader: return "MalformedHunkHeader";
        case ErrorKind::EmptyDiff: return "EmptyDiff";
        case ErrorKind::HunkMismatch: return "HunkMismatch";
        case ErrorKind::HunkOutOfRange: return "HunkOutOfRange";
        case ErrorKind::HunksOutOfOrder: return "HunksOutOfOrder";
        case ErrorKind::StructuralCheckFailed: return "StructuralCheckFailed";
        case ErrorKind::ValidationFailed: return "ValidationFailed";
        case ErrorKind::MissingArgument: return "MissingArgument";
        case ErrorKind::InvalidArguments: return "InvalidArguments";
    }
    return "Unknown";
}

size_t Hunk::deletions() const {
    return std::count_if(edits.begin(), edits.end(),
                         [](const DiffLine& l) { return l.kind == DiffLineKind::Delete; });
}

size_t Hunk::insertions() const {
    return std::count_if(edits.begin(), edits.end(),
                         [](const DiffLine& l) { return l.kind == DiffLineKind::Insert; });
}

} // namespace patchwork
