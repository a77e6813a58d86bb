#pragma once
#include <memory>
#include <string>
#include "patch/PatchTypes.hpp"
#include "patch/HunkApplier.hpp"
#include "patch/ValidationGate.hpp"

namespace patchwork {

// Maps a caller-supplied path to a filesystem path under policy. Throws PatchError(InvalidPath).
class PathResolver {
public:
    virtual ~PathResolver() = default;
    virtual std::string resolve(const std::string& raw_path) = 0;
};

struct SearchReplaceRequest {
    std::string path;
    std::string search_block;
    std::string replace_block;
    bool strict = true;
};

struct DiffPatchRequest {
    std::string path;
    std::string diff_text;
};

struct TransactionOptions {
    ApplyOptions apply;
    bool journal = true; // keep a backup copy while the new bytes are swapped in
};

enum class TransactionState {
    Pending,
    Opened,
    Transformed,
    StructurallyChecked,
    Validated,
    Committed,
    Aborted
};

const char* to_string(TransactionState state);

/*
 * One patch operation against one file:
 *   read -> transform -> structural check (search/replace only) -> syntax gate -> atomic write
 * The first failure aborts, and nothing is written before the final step.
 * A transaction runs once. The caller serializes transactions that target the same path.
 */
class PatchTransaction {
public:
    PatchTransaction(std::shared_ptr<PathResolver> resolver,
                     std::shared_ptr<ValidationGate> gate,
                     TransactionOptions options = {});

    PatchOutcome run(const SearchReplaceRequest& request);
    PatchOutcome run(const DiffPatchRequest& request);

    TransactionState state() const { return state_; }
    const std::string& resolved_path() const { return path_; }

private:
    std::shared_ptr<PathResolver> resolver_;
    std::shared_ptr<ValidationGate> gate_;
    TransactionOptions options_;
    TransactionState state_ = TransactionState::Pending;
    std::string path_;

    void begin();
    std::string open(const std::string& raw_path);
    void validate(const std::string& candidate);
    void commit(const std::string& candidate);
    void advance(TransactionState next);
    PatchOutcome abort(const PatchError& e);
};

} // namespace patchwork
