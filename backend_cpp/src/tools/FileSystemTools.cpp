#include "tools/FileSystemTools.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <spdlog/spdlog.h>

namespace patchwork {

namespace fs = std::filesystem;

bool FileSystemTools::is_inside_path(const fs::path& child, const fs::path& parent) {
    if (parent.empty()) return false;
    auto c = child.lexically_normal();
    auto p = parent.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        // trailing separator leaves an empty segment
        if (it_p->empty()) continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

PatchConfig FileSystemTools::load_config(const std::string& root) {
    PatchConfig config;
    fs::path config_path = fs::path(root) / ".patchwork" / "config.json";

    if (!fs::exists(config_path)) {
        // Fallback to root
        config_path = fs::path(root) / "config.json";
    }
    if (!fs::exists(config_path)) return config;

    try {
        std::ifstream f(config_path);
        auto j = nlohmann::json::parse(f);
        config.verify_context = j.value("verify_context", config.verify_context);
        config.check_hunk_order = j.value("check_hunk_order", config.check_hunk_order);
        config.journal = j.value("journal", config.journal);
        config.validate_syntax = j.value("validate_syntax", config.validate_syntax);
        config.ignored_paths = j.value("ignored_paths", std::vector<std::string>{});
        config.log_level = j.value("log_level", config.log_level);
        config.port = j.value("port", config.port);
        spdlog::info("⚙️  Config Synced from {}: {} ignored paths, context check {}, order check {}",
                     config_path.string(), config.ignored_paths.size(),
                     config.verify_context ? "on" : "off", config.check_hunk_order ? "on" : "off");
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("❌ Config corrupted at {}: {}. Using defaults.", config_path.string(), e.what());
        return PatchConfig{};
    }
    return config;
}

WorkspacePathResolver::WorkspacePathResolver(const std::string& root, std::vector<std::string> ignored_paths)
    : root_(fs::absolute(root).lexically_normal()), ignored_paths_(std::move(ignored_paths)) {}

std::string WorkspacePathResolver::resolve(const std::string& raw_path) {
    if (raw_path.empty()) {
        throw PatchError(ErrorKind::InvalidPath, "Invalid file path: path is empty");
    }
    if (root_.relative_path().empty()) {
        throw PatchError(ErrorKind::InvalidPath, "Invalid file path: filesystem root is not a workspace");
    }

    fs::path requested(raw_path);
    fs::path target = requested.is_absolute() ? requested.lexically_normal()
                                              : (root_ / requested).lexically_normal();

    if (!FileSystemTools::is_inside_path(target, root_)) {
        throw PatchError(ErrorKind::InvalidPath,
                         "Invalid file path: '" + raw_path + "' is outside the workspace " + root_.string());
    }

    // A symlink inside the workspace must not carry a write outside it
    std::error_code ec;
    if (fs::exists(target, ec)) {
        fs::path real = fs::canonical(target, ec);
        fs::path real_root = ec ? fs::path() : fs::canonical(root_, ec);
        if (ec || !FileSystemTools::is_inside_path(real, real_root)) {
            spdlog::warn("🛑 WRITE BLOCKED (Link Escape): {}", target.string());
            throw PatchError(ErrorKind::InvalidPath,
                             "Invalid file path: '" + raw_path + "' resolves outside the workspace " + root_.string());
        }
    }

    fs::path rel = target.lexically_relative(root_);
    for (const auto& ignored : ignored_paths_) {
        if (FileSystemTools::is_inside_path(rel, fs::path(ignored))) {
            spdlog::warn("🛑 WRITE BLOCKED (Ignored Path): {}", target.string());
            throw PatchError(ErrorKind::InvalidPath,
                             "Invalid file path: '" + raw_path + "' is under ignored path '" + ignored + "'");
        }
    }
    return target.string();
}

} // namespace patchwork
