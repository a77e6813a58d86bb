#include "patch/PatchTransaction.hpp"
#include "patch/DiffParser.hpp"
#include "patch/ReplaceEngine.hpp"
#include "tools/AtomicJournal.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace patchwork {

namespace fs = std::filesystem;

namespace {

// Strict UTF-8 well-formedness (no overlongs, no surrogates, max U+10FFFF)
bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len;
        unsigned int cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

}

const char* to_string(TransactionState state) {
    switch (state) {
        case TransactionState::Pending: return "Pending";
        case TransactionState::Opened: return "Opened";
        case TransactionState::Transformed: return "Transformed";
        case TransactionState::StructurallyChecked: return "StructurallyChecked";
        case TransactionState::Validated: return "Validated";
        case TransactionState::Committed: return "Committed";
        case TransactionState::Aborted: return "Aborted";
    }
    return "Unknown";
}

PatchTransaction::PatchTransaction(std::shared_ptr<PathResolver> resolver,
                                   std::shared_ptr<ValidationGate> gate,
                                   TransactionOptions options)
    : resolver_(std::move(resolver)), gate_(std::move(gate)), options_(options) {}

void PatchTransaction::begin() {
    if (state_ != TransactionState::Pending) {
        throw std::logic_error("PatchTransaction already ran (state " + std::string(to_string(state_)) + ")");
    }
}

void PatchTransaction::advance(TransactionState next) {
    spdlog::debug("Transaction {}: {} -> {}", path_, to_string(state_), to_string(next));
    state_ = next;
}

std::string PatchTransaction::open(const std::string& raw_path) {
    path_ = resolver_ ? resolver_->resolve(raw_path) : raw_path;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw PatchError(ErrorKind::FileNotFound, "File not found: " + path_);
    }
    if (fs::is_directory(path_, ec)) {
        throw PatchError(ErrorKind::ReadError, "Path is a directory: " + path_);
    }

    std::ifstream f(path_, std::ios::in | std::ios::binary);
    if (!f) {
        throw PatchError(ErrorKind::ReadError, "Error reading file '" + path_ + "': cannot open");
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw PatchError(ErrorKind::ReadError, "Error reading file '" + path_ + "': I/O failure");
    }
    std::string content = buffer.str();
    if (!is_valid_utf8(content)) {
        throw PatchError(ErrorKind::ReadError, "Error reading file '" + path_ + "': not valid UTF-8");
    }

    advance(TransactionState::Opened);
    return content;
}

void PatchTransaction::validate(const std::string& candidate) {
    if (gate_) {
        ValidationResult r = gate_->validate(candidate, path_);
        if (!r.ok) {
            throw PatchError(ErrorKind::ValidationFailed, r.message).at(r.line, r.column);
        }
    }
    advance(TransactionState::Validated);
}

void PatchTransaction::commit(const std::string& candidate) {
    std::error_code ec;
    const std::string target = AtomicJournal::write_target(path_, ec);
    if (ec) {
        throw PatchError(ErrorKind::WriteError, "Cannot resolve link '" + path_ + "': " + ec.message());
    }
    if (target != path_) spdlog::debug("Following symlink {} -> {}", path_, target);

    if (options_.journal && !AtomicJournal::backup(target, ec)) {
        throw PatchError(ErrorKind::WriteError, "Failed to secure file backup for '" + target + "': " + ec.message());
    }

    if (!AtomicJournal::write_atomic(target, candidate, ec)) {
        if (options_.journal && !AtomicJournal::rollback(target)) {
            spdlog::error("💥 Rollback failed for {}; journal kept at {}", target, AtomicJournal::journal_path(target));
        }
        throw PatchError(ErrorKind::WriteError, "Error writing file '" + target + "': " + ec.message());
    }

    if (options_.journal) AtomicJournal::commit(target);
    advance(TransactionState::Committed);
}

PatchOutcome PatchTransaction::abort(const PatchError& e) {
    if (e.kind() == ErrorKind::WriteError) {
        spdlog::error("💥 Validated patch could not be persisted to {}: {}", path_, e.what());
    } else {
        spdlog::warn("🛑 Patch aborted in state {} [{}] {}: {}", to_string(state_), to_string(e.kind()), path_, e.what());
    }
    state_ = TransactionState::Aborted;
    return PatchOutcome::failure({e.kind(), e.what(), e.line(), e.column(), e.count()});
}

PatchOutcome PatchTransaction::run(const SearchReplaceRequest& request) {
    begin();
    try {
        std::string original = open(request.path);

        ReplaceResult r = ReplaceEngine::replace(original, request.search_block, request.replace_block, request.strict);
        advance(TransactionState::Transformed);

        ReplaceEngine::verify(original, r.applied_text, request.search_block, request.replace_block);
        advance(TransactionState::StructurallyChecked);

        validate(r.applied_text);
        commit(r.applied_text);

        spdlog::info("💾 Replaced {} occurrence(s) in {}", r.match_count, path_);
        return PatchOutcome::success(std::move(r.applied_text), r.match_count);
    } catch (const PatchError& e) {
        return abort(e);
    }
}

PatchOutcome PatchTransaction::run(const DiffPatchRequest& request) {
    begin();
    try {
        std::string original = open(request.path);

        DiffSet hunks = DiffParser::parse(request.diff_text);
        HunkApplier applier(options_.apply);
        std::string patched = applier.apply(original, hunks);
        advance(TransactionState::Transformed);

        validate(patched);
        commit(patched);

        spdlog::info("💾 Applied {} hunk(s) to {}", hunks.size(), path_);
        return PatchOutcome::success(std::move(patched), static_cast<int>(hunks.size()));
    } catch (const PatchError& e) {
        return abort(e);
    }
}

} // namespace patchwork
