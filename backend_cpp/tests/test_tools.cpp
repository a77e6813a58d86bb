#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "LogManager.hpp"
#include "tools/FileSurgicalTool.hpp"
#include "tools/FileSystemTools.hpp"
#include "tools/ToolRegistry.hpp"

using namespace patchwork;
namespace fs = std::filesystem;

namespace {

fs::path make_workspace(const std::string& name) {
    fs::path dir = (fs::temp_directory_path() / ("patchwork_tools_" + name)).lexically_normal();
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

void wire(ToolRegistry& registry, const fs::path& root, const PatchConfig& config = {}) {
    SurgeryKit kit;
    kit.resolver = std::make_shared<WorkspacePathResolver>(root.string(), config.ignored_paths);
    kit.gate = ValidationGate::with_defaults();
    kit.options = config.transaction_options();
    register_surgical_tools(registry, kit);
}

}

void test_manifest() {
    std::cout << "Testing tool manifest..." << std::endl;

    fs::path root = make_workspace("manifest");
    ToolRegistry registry;
    wire(registry, root);

    assert(registry.has_tool("search_replace_file"));
    assert(registry.has_tool("apply_diff_patch"));
    assert(!registry.has_tool("read_file"));

    nlohmann::json manifest = registry.get_manifest_json();
    assert(manifest.size() == 2);
    for (const auto& tool : manifest) {
        assert(tool["parameters"]["type"] == "object");
        assert(tool["parameters"]["required"].size() >= 2);
    }

    fs::remove_all(root);
    std::cout << "  ✓ Manifest tests passed" << std::endl;
}

void test_search_replace_tool() {
    std::cout << "Testing search_replace_file..." << std::endl;

    fs::path root = make_workspace("replace");
    write_file(root / "app.py", "def f():\n    return 1\n\ndef g():\n    return 1\n");
    ToolRegistry registry;
    wire(registry, root);

    ToolResult one = registry.dispatch("search_replace_file",
        {{"file_path", "app.py"}, {"search_block", "def g():"}, {"replace_block", "def h():"}});
    assert(one.success);
    assert(one.message.rfind("SUCCESS: Successfully replaced 1 occurrence in '", 0) == 0);
    assert(contains(one.message, "app.py"));

    ToolResult ambiguous = registry.dispatch("search_replace_file",
        {{"file_path", "app.py"}, {"search_block", "return 1"}, {"replace_block", "return 2"}});
    assert(!ambiguous.success);
    assert(ambiguous.message.rfind("ERROR: Search and replace failed for '", 0) == 0);
    assert(contains(ambiguous.message, "2"));

    ToolResult all = registry.dispatch("search_replace_file",
        {{"file_path", "app.py"}, {"search_block", "return 1"}, {"replace_block", "return 2"}, {"strict", false}});
    assert(all.success);
    assert(contains(all.message, "Successfully replaced 2 occurrences"));
    assert(read_file(root / "app.py") == "def f():\n    return 2\n\ndef h():\n    return 2\n");

    ToolResult broken = registry.dispatch("search_replace_file",
        {{"file_path", "app.py"}, {"search_block", "def f():"}, {"replace_block", "def f(:"}});
    assert(!broken.success);
    assert(contains(broken.message, "Replacement would create invalid syntax in '"));
    assert(contains(broken.message, "The file was NOT modified."));
    assert(read_file(root / "app.py") == "def f():\n    return 2\n\ndef h():\n    return 2\n");

    fs::remove_all(root);
    std::cout << "  ✓ search_replace_file tests passed" << std::endl;
}

void test_diff_tool() {
    std::cout << "Testing apply_diff_patch..." << std::endl;

    fs::path root = make_workspace("diff");
    write_file(root / "list.txt", "a\nb\nc\n");
    ToolRegistry registry;
    wire(registry, root);

    nlohmann::json args = {{"file_path", "list.txt"}, {"diff", "@@ -2 +2 @@\n-b\n+B\n"}};
    ToolResult ok = registry.dispatch("apply_diff_patch", args);
    assert(ok.success);
    assert(contains(ok.message, "Successfully applied diff patch (1 hunk(s)) to '"));
    assert(read_file(root / "list.txt") == "a\nB\nc\n");

    ToolResult again = registry.dispatch("apply_diff_patch", args);
    assert(!again.success);
    assert(again.message.rfind("ERROR: Error applying diff to '", 0) == 0);
    assert(read_file(root / "list.txt") == "a\nB\nc\n");

    ToolResult header = registry.dispatch("apply_diff_patch",
        {{"file_path", "list.txt"}, {"diff", "@@ -one +two @@\n-a\n"}});
    assert(contains(header.message, "Invalid hunk header: @@ -one +two @@"));

    fs::remove_all(root);
    std::cout << "  ✓ apply_diff_patch tests passed" << std::endl;
}

void test_argument_errors() {
    std::cout << "Testing argument errors..." << std::endl;

    fs::path root = make_workspace("args");
    write_file(root / "x.txt", "x\n");
    ToolRegistry registry;
    wire(registry, root);

    ToolResult missing = registry.dispatch("search_replace_file", {{"file_path", "x.txt"}, {"search_block", "x"}});
    assert(!missing.success);
    assert(missing.message == "ERROR: Missing required argument: 'replace_block'");

    ToolResult no_diff = registry.dispatch("apply_diff_patch", {{"file_path", "x.txt"}});
    assert(no_diff.message == "ERROR: Missing required argument: 'diff'");

    ToolResult wrong_type = registry.dispatch("search_replace_file",
        {{"file_path", "x.txt"}, {"search_block", "x"}, {"replace_block", "y"}, {"strict", "yes"}});
    assert(wrong_type.message == "ERROR: Argument 'strict' must be a boolean");

    ToolResult not_object = registry.dispatch("apply_diff_patch", nlohmann::json::array({1, 2}));
    assert(not_object.message == "ERROR: Arguments must be a JSON object");

    ToolResult unknown = registry.dispatch("delete_everything", nlohmann::json::object());
    assert(unknown.message == "ERROR: Tool 'delete_everything' not found.");

    ToolResult outside = registry.dispatch("search_replace_file",
        {{"file_path", "../../etc/passwd"}, {"search_block", "root"}, {"replace_block", "toor"}});
    assert(!outside.success);
    assert(contains(outside.message, "Invalid file path"));

    assert(read_file(root / "x.txt") == "x\n");

    fs::remove_all(root);
    std::cout << "  ✓ Argument error tests passed" << std::endl;
}

void test_patch_log() {
    std::cout << "Testing patch log..." << std::endl;

    fs::path root = make_workspace("log");
    write_file(root / "x.txt", "x\n");
    ToolRegistry registry;
    wire(registry, root);

    LogManager::instance().clear();
    registry.dispatch("search_replace_file", {{"file_path", "x.txt"}, {"search_block", "x"}, {"replace_block", "y"}});
    registry.dispatch("apply_diff_patch", {{"file_path", "x.txt"}, {"diff", "@@ -1 +1 @@\n-nope\n+z\n"}});
    assert(LogManager::instance().size() == 2);

    nlohmann::json logs = LogManager::instance().get_logs_json();
    // Newest first
    assert(logs[0]["tool"] == "apply_diff_patch");
    assert(logs[0]["success"] == false);
    assert(logs[1]["tool"] == "search_replace_file");
    assert(logs[1]["success"] == true);
    assert(logs[1]["file_path"] == "x.txt");
    assert(LogManager::instance().failures() == 1);
    assert(LogManager::instance().get_logs_json("x.txt").size() == 2);
    assert(LogManager::instance().get_logs_json("other.txt").empty());

    for (int i = 0; i < 60; ++i) {
        LogManager::instance().add_log({i, "apply_diff_patch", "x.txt", true, "SUCCESS", 0.0});
    }
    assert(LogManager::instance().size() == LogManager::kCapacity);
    LogManager::instance().clear();

    fs::remove_all(root);
    std::cout << "  ✓ Patch log tests passed" << std::endl;
}

void test_config() {
    std::cout << "Testing workspace config..." << std::endl;

    fs::path root = make_workspace("config");

    PatchConfig defaults = FileSystemTools::load_config(root.string());
    assert(!defaults.verify_context);
    assert(defaults.journal);
    assert(defaults.validate_syntax);
    assert(defaults.port == 5003);

    fs::create_directories(root / ".patchwork");
    write_file(root / ".patchwork" / "config.json",
               R"({"verify_context": true, "check_hunk_order": true, "journal": false,
                   "ignored_paths": ["vendor", "build/gen"], "log_level": "debug", "port": 6001})");
    PatchConfig c = FileSystemTools::load_config(root.string());
    assert(c.verify_context && c.check_hunk_order && !c.journal);
    assert(c.ignored_paths.size() == 2);
    assert(c.log_level == "debug");
    assert(c.port == 6001);

    TransactionOptions o = c.transaction_options();
    assert(o.apply.verify_context && o.apply.check_order && !o.journal);

    // Ignored paths are off limits for writes
    fs::create_directories(root / "vendor");
    write_file(root / "vendor" / "lib.txt", "v\n");
    ToolRegistry registry;
    wire(registry, root, c);
    ToolResult blocked = registry.dispatch("search_replace_file",
        {{"file_path", "vendor/lib.txt"}, {"search_block", "v"}, {"replace_block", "w"}});
    assert(!blocked.success);
    assert(contains(blocked.message, "ignored path 'vendor'"));
    assert(read_file(root / "vendor" / "lib.txt") == "v\n");

    // Corrupt file falls back to defaults
    write_file(root / ".patchwork" / "config.json", "{ not json");
    PatchConfig fallback = FileSystemTools::load_config(root.string());
    assert(fallback.ignored_paths.empty());
    assert(fallback.port == 5003);

    fs::remove_all(root);
    std::cout << "  ✓ Config tests passed" << std::endl;
}

void test_path_resolver() {
    std::cout << "Testing workspace path resolution..." << std::endl;

    fs::path root = make_workspace("resolver");
    WorkspacePathResolver resolver(root.string(), {"secrets"});

    assert(resolver.resolve("src/a.cpp") == (root / "src" / "a.cpp").string());
    assert(resolver.resolve("src/../b.cpp") == (root / "b.cpp").string());
    assert(resolver.resolve((root / "c.txt").string()) == (root / "c.txt").string());

    const char* rejected[] = {"", "../x", "/etc/hosts", "secrets/key.pem"};
    for (const char* raw : rejected) {
        bool threw = false;
        try {
            resolver.resolve(raw);
        } catch (const PatchError& e) {
            threw = true;
            assert(e.kind() == ErrorKind::InvalidPath);
        }
        assert(threw);
    }

    assert(FileSystemTools::is_inside_path("/a/b/c", "/a/b"));
    assert(!FileSystemTools::is_inside_path("/a/bc", "/a/b"));

    fs::remove_all(root);
    std::cout << "  ✓ Path resolution tests passed" << std::endl;
}

int main() {
    std::cout << "Running tool layer tests...\n" << std::endl;

    test_manifest();
    test_search_replace_tool();
    test_diff_tool();
    test_argument_errors();
    test_patch_log();
    test_config();
    test_path_resolver();

    std::cout << "\n✓ All tool layer tests passed!" << std::endl;
    return 0;
}
