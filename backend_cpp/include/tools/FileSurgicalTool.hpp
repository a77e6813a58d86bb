#pragma once
#include <memory>
#include <utility>
#include "tools/ToolRegistry.hpp"
#include "patch/PatchTransaction.hpp"

namespace patchwork {

// Shared wiring for the two editing tools
struct SurgeryKit {
    std::shared_ptr<PathResolver> resolver;
    std::shared_ptr<ValidationGate> gate;
    TransactionOptions options;
};

// {file_path, search_block, replace_block, strict=true}
class SearchReplaceFileTool : public ITool {
public:
    explicit SearchReplaceFileTool(SurgeryKit kit) : kit_(std::move(kit)) {}

    ToolMetadata get_metadata() override {
        return {
            "search_replace_file",
            "Perform deterministic search and replace in a file. Requires EXACTLY 1 match by default (strict mode). "
            "Tabs count as 4 spaces when matching. With strict=false every occurrence is replaced and the replacement "
            "is inserted as given, without re-indentation. Syntax is validated before saving.",
            R"({"type":"object","properties":{"file_path":{"type":"string"},"search_block":{"type":"string"},"replace_block":{"type":"string"},"strict":{"type":"boolean","default":true}},"required":["file_path","search_block","replace_block"]})"
        };
    }

    ToolResult execute(const std::string& args_json) override;

private:
    SurgeryKit kit_;
};

// {file_path, diff}
class ApplyDiffPatchTool : public ITool {
public:
    explicit ApplyDiffPatchTool(SurgeryKit kit) : kit_(std::move(kit)) {}

    ToolMetadata get_metadata() override {
        return {
            "apply_diff_patch",
            "Apply a unified diff patch to a file. Format: @@ -start,count +start,count @@ followed by context ( ), "
            "deletions (-), and additions (+) lines. Deleted lines must match the file. Syntax is validated after patching.",
            R"({"type":"object","properties":{"file_path":{"type":"string"},"diff":{"type":"string"}},"required":["file_path","diff"]})"
        };
    }

    ToolResult execute(const std::string& args_json) override;

private:
    SurgeryKit kit_;
};

// Registers both editing tools on the registry
void register_surgical_tools(ToolRegistry& registry, const SurgeryKit& kit);

}
