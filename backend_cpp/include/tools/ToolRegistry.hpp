#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "LogManager.hpp"

namespace patchwork {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string parameter_schema; // JSON Schema text
};

struct ToolResult {
    bool success;
    std::string message; // "SUCCESS: ..." or "ERROR: ..."

    static ToolResult ok(const std::string& msg) { return {true, "SUCCESS: " + msg}; }
    static ToolResult fail(const std::string& msg) { return {false, "ERROR: " + msg}; }
};

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    virtual ToolResult execute(const std::string& args_json) = 0;
};

class ToolRegistry {
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        const std::string name = tool->get_metadata().name;
        spdlog::info("🛰️ Tool registered: {}", name);
        tools_[name] = std::move(tool);
    }

    bool has_tool(const std::string& name) const { return tools_.count(name) > 0; }

    // [{name, description, parameters}] with the schema embedded as an object
    nlohmann::json get_manifest_json() const {
        auto manifest = nlohmann::json::array();
        for (const auto& entry : tools_) {
            ToolMetadata meta = entry.second->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"parameters", nlohmann::json::parse(meta.parameter_schema)}
            });
        }
        return manifest;
    }

    // Runs the tool and records the call in the patch log
    ToolResult dispatch(const std::string& name, const nlohmann::json& args) {
        auto it = tools_.find(name);
        if (it == tools_.end()) return ToolResult::fail("Tool '" + name + "' not found.");

        using clock = std::chrono::steady_clock;
        const auto started = clock::now();
        ToolResult result = it->second->execute(args.dump());
        const double elapsed = std::chrono::duration<double, std::milli>(clock::now() - started).count();

        PatchLog entry;
        entry.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        entry.tool = name;
        entry.file_path = target_of(args);
        entry.success = result.success;
        entry.result = result.message;
        entry.duration_ms = elapsed;
        LogManager::instance().add_log(entry);
        return result;
    }

private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;

    static std::string target_of(const nlohmann::json& args) {
        if (!args.is_object()) return "";
        auto it = args.find("file_path");
        return (it != args.end() && it->is_string()) ? it->get<std::string>() : "";
    }
};

}
