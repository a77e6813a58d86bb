#include "server/PatchService.hpp"
#include "tools/FileSurgicalTool.hpp"
#include "patch/ValidationGate.hpp"
#include "LogManager.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>

namespace patchwork {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

ServiceReply failure(int status, const std::string& message) {
    return {status, json{{"success", false}, {"message", "ERROR: " + message}}};
}

}

void PathLocks::sweep() {
    for (auto it = locks_.begin(); it != locks_.end();) {
        if (it->second.expired()) it = locks_.erase(it);
        else ++it;
    }
}

std::shared_ptr<std::mutex> PathLocks::mutex_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    sweep();
    std::weak_ptr<std::mutex>& slot = locks_[key];
    std::shared_ptr<std::mutex> held = slot.lock();
    if (!held) {
        held = std::make_shared<std::mutex>();
        slot = held;
    }
    return held;
}

size_t PathLocks::tracked() {
    std::lock_guard<std::mutex> lock(mtx_);
    sweep();
    return locks_.size();
}

PatchService::PatchService(const std::string& root, const PatchConfig& config)
    : config_(config),
      resolver_(std::make_shared<WorkspacePathResolver>(root, config_.ignored_paths))
{
    SurgeryKit kit;
    kit.resolver = resolver_;
    kit.gate = config_.validate_syntax ? ValidationGate::with_defaults() : std::make_shared<ValidationGate>();
    kit.options = config_.transaction_options();
    register_surgical_tools(tools_, kit);
}

ServiceReply PatchService::manifest() const {
    return {200, tools_.get_manifest_json()};
}

ServiceReply PatchService::logs(const std::string& file_path_filter) const {
    auto& log = LogManager::instance();
    return {200, json{{"failures", log.failures()}, {"entries", log.get_logs_json(file_path_filter)}}};
}

std::string PatchService::lock_key(const json& args) const {
    if (!args.is_object()) return "";
    auto it = args.find("file_path");
    if (it == args.end() || !it->is_string()) return "";

    std::string resolved;
    try {
        resolved = resolver_->resolve(it->get<std::string>());
    } catch (const PatchError& e) {
        // Rejected paths are never written, so they need no lock
        spdlog::debug("No lock for unresolvable path: {}", e.what());
        return "";
    }

    // Link and target share one key
    std::error_code ec;
    fs::path real = fs::weakly_canonical(resolved, ec);
    return ec ? resolved : real.string();
}

ServiceReply PatchService::call_tool(const std::string& name, const std::string& body) {
    if (!tools_.has_tool(name)) return failure(404, "Tool '" + name + "' not found.");

    json args = json::parse(body, nullptr, false);
    if (args.is_discarded()) return failure(400, "Invalid JSON arguments.");

    std::shared_ptr<std::mutex> path_mutex;
    std::unique_lock<std::mutex> guard;
    const std::string key = lock_key(args);
    if (!key.empty()) {
        path_mutex = locks_.mutex_for(key);
        guard = std::unique_lock<std::mutex>(*path_mutex);
    }

    spdlog::info("🎯 Tool call: {}", name);
    ToolResult result = tools_.dispatch(name, args);
    return {result.success ? 200 : 422, json{{"success", result.success}, {"message", result.message}}};
}

} // namespace patchwork
