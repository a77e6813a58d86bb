#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace patchwork {

// One tool call against one file
struct PatchLog {
    long long timestamp;     // ms since epoch
    std::string tool;        // search_replace_file / apply_diff_patch
    std::string file_path;   // as given by the caller
    bool success;
    std::string result;      // the message handed back to the caller
    double duration_ms;
};

class LogManager {
public:
    static constexpr size_t kCapacity = 50;

    static LogManager& instance() {
        static LogManager manager;
        return manager;
    }

    void add_log(const PatchLog& entry) {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.push_back(entry);
        while (entries_.size() > kCapacity) entries_.pop_front();
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mtx_);
        return entries_.size();
    }

    size_t failures() {
        std::lock_guard<std::mutex> lock(mtx_);
        size_t n = 0;
        for (const auto& e : entries_) {
            if (!e.success) ++n;
        }
        return n;
    }

    // Newest first. An empty filter returns every entry.
    nlohmann::json get_logs_json(const std::string& file_path_filter = "") {
        std::lock_guard<std::mutex> lock(mtx_);
        auto out = nlohmann::json::array();
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            if (!file_path_filter.empty() && it->file_path != file_path_filter) continue;
            out.push_back({
                {"timestamp", it->timestamp},
                {"tool", it->tool},
                {"file_path", it->file_path},
                {"success", it->success},
                {"result", it->result},
                {"duration_ms", it->duration_ms}
            });
        }
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.clear();
    }

private:
    LogManager() = default;
    std::deque<PatchLog> entries_;
    std::mutex mtx_;
};

}
