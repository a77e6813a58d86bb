#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include "patch/PatchTransaction.hpp"

namespace patchwork {

// 🛰️ Workspace rules, read from <root>/.patchwork/config.json
struct PatchConfig {
    bool verify_context = false;
    bool check_hunk_order = false;
    bool journal = true;
    bool validate_syntax = true;
    std::vector<std::string> ignored_paths;
    std::string log_level = "info";
    int port = 5003;

    TransactionOptions transaction_options() const {
        TransactionOptions o;
        o.apply.verify_context = verify_context;
        o.apply.check_order = check_hunk_order;
        o.journal = journal;
        return o;
    }
};

class FileSystemTools {
public:
    static PatchConfig load_config(const std::string& root_path);

    // Segment-wise containment, after lexical normalization
    static bool is_inside_path(const std::filesystem::path& child, const std::filesystem::path& parent);
};

// 🛡️ Relative paths resolve under the workspace root; nothing may escape it
class WorkspacePathResolver : public PathResolver {
public:
    explicit WorkspacePathResolver(const std::string& root, std::vector<std::string> ignored_paths = {});

    std::string resolve(const std::string& raw_path) override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::vector<std::string> ignored_paths_;
};

} // namespace patchwork
