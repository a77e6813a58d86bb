#include "tools/FileSurgicalTool.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace patchwork {

namespace {

nlohmann::json parse_args(const std::string& args_json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(args_json);
    } catch (const nlohmann::json::parse_error& e) {
        throw PatchError(ErrorKind::InvalidArguments, std::string("Invalid JSON arguments: ") + e.what());
    }
    if (!j.is_object()) {
        throw PatchError(ErrorKind::InvalidArguments, "Arguments must be a JSON object");
    }
    return j;
}

std::string required_string(const nlohmann::json& j, const std::string& name) {
    if (!j.contains(name) || j[name].is_null()) {
        throw PatchError(ErrorKind::MissingArgument, "Missing required argument: '" + name + "'");
    }
    if (!j[name].is_string()) {
        throw PatchError(ErrorKind::InvalidArguments, "Argument '" + name + "' must be a string");
    }
    return j[name].get<std::string>();
}

bool optional_bool(const nlohmann::json& j, const std::string& name, bool fallback) {
    if (!j.contains(name) || j[name].is_null()) return fallback;
    if (!j[name].is_boolean()) {
        throw PatchError(ErrorKind::InvalidArguments, "Argument '" + name + "' must be a boolean");
    }
    return j[name].get<bool>();
}

std::string shown_path(const PatchTransaction& tx, const std::string& raw) {
    return tx.resolved_path().empty() ? raw : tx.resolved_path();
}

}

ToolResult SearchReplaceFileTool::execute(const std::string& args_json) {
    SearchReplaceRequest req;
    try {
        auto j = parse_args(args_json);
        req.path = required_string(j, "file_path");
        req.search_block = required_string(j, "search_block");
        req.replace_block = required_string(j, "replace_block");
        req.strict = optional_bool(j, "strict", true);
    } catch (const PatchError& e) {
        return ToolResult::fail(e.what());
    }

    PatchTransaction tx(kit_.resolver, kit_.gate, kit_.options);
    PatchOutcome outcome = tx.run(req);
    const std::string path = shown_path(tx, req.path);

    if (outcome.committed) {
        if (outcome.match_count == 1) {
            return ToolResult::ok("Successfully replaced 1 occurrence in '" + path + "'");
        }
        return ToolResult::ok("Successfully replaced " + std::to_string(outcome.match_count) +
                              " occurrences in '" + path + "'");
    }

    const Diagnostic& d = *outcome.diagnostic;
    switch (d.kind) {
        case ErrorKind::EmptyBlock:
        case ErrorKind::NoMatch:
        case ErrorKind::AmbiguousMatch:
            return ToolResult::fail("Search and replace failed for '" + path + "': " + d.message);
        case ErrorKind::StructuralCheckFailed:
            return ToolResult::fail("Replacement validation failed for '" + path + "': " + d.message);
        case ErrorKind::ValidationFailed:
            return ToolResult::fail("Replacement would create invalid syntax in '" + path + "':\n" + d.message +
                                    "\n\nThe file was NOT modified. Please fix the syntax error in your "
                                    "replacement block and try again.");
        default:
            return ToolResult::fail(d.message);
    }
}

ToolResult ApplyDiffPatchTool::execute(const std::string& args_json) {
    DiffPatchRequest req;
    try {
        auto j = parse_args(args_json);
        req.path = required_string(j, "file_path");
        req.diff_text = required_string(j, "diff");
    } catch (const PatchError& e) {
        return ToolResult::fail(e.what());
    }

    PatchTransaction tx(kit_.resolver, kit_.gate, kit_.options);
    PatchOutcome outcome = tx.run(req);
    const std::string path = shown_path(tx, req.path);

    if (outcome.committed) {
        return ToolResult::ok("Successfully applied diff patch (" + std::to_string(outcome.match_count) +
                              " hunk(s)) to '" + path + "'");
    }

    const Diagnostic& d = *outcome.diagnostic;
    switch (d.kind) {
        case ErrorKind::MalformedHunkHeader:
        case ErrorKind::EmptyDiff:
        case ErrorKind::HunkMismatch:
        case ErrorKind::HunkOutOfRange:
        case ErrorKind::HunksOutOfOrder:
            return ToolResult::fail("Error applying diff to '" + path + "': " + d.message);
        case ErrorKind::ValidationFailed:
            return ToolResult::fail("Patch would create invalid syntax in '" + path + "':\n" + d.message +
                                    "\n\nThe file was NOT modified.");
        default:
            return ToolResult::fail(d.message);
    }
}

void register_surgical_tools(ToolRegistry& registry, const SurgeryKit& kit) {
    registry.register_tool(std::make_unique<SearchReplaceFileTool>(kit));
    registry.register_tool(std::make_unique<ApplyDiffPatchTool>(kit));
}

}
