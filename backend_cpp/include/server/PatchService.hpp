#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "tools/FileSystemTools.hpp"
#include "tools/ToolRegistry.hpp"

namespace patchwork {

// Status code and JSON body of one HTTP reply
struct ServiceReply {
    int status = 200;
    nlohmann::json body;
};

// One mutex per write target. An entry lives only while a request holds its mutex.
class PathLocks {
public:
    std::shared_ptr<std::mutex> mutex_for(const std::string& key);

    // Entries still held by some request
    size_t tracked();

private:
    std::mutex mtx_;
    std::unordered_map<std::string, std::weak_ptr<std::mutex>> locks_;

    void sweep();
};

/*
 * Transport-free core of patchwork_server:
 *   GET  /api/tools        -> manifest()
 *   POST /api/tools/:name  -> call_tool(name, body)
 *   GET  /api/admin/logs   -> logs(file_path)
 * Calls that resolve to the same file run one at a time.
 */
class PatchService {
public:
    PatchService(const std::string& root, const PatchConfig& config);

    ServiceReply manifest() const;
    ServiceReply call_tool(const std::string& name, const std::string& body);
    ServiceReply logs(const std::string& file_path_filter) const;

    const WorkspacePathResolver& resolver() const { return *resolver_; }
    PathLocks& locks() { return locks_; }

private:
    PatchConfig config_;
    std::shared_ptr<WorkspacePathResolver> resolver_;
    ToolRegistry tools_;
    PathLocks locks_;

    // Real path of the file a call would write, or "" when it does not resolve
    std::string lock_key(const nlohmann::json& args) const;
};

} // namespace patchwork
