#pragma once
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace patchwork {
namespace fs = std::filesystem;

// Backup-then-swap persistence for one file. The journal copy survives until commit()
// so a failed swap can be rolled back to the exact pre-call bytes.
class AtomicJournal {
public:
    static std::string journal_path(const std::string& filePath) { return filePath + ".patchwork_journal"; }
    static std::string temp_path(const std::string& filePath) { return filePath + ".patchwork_tmp"; }

    // The file a write must land on: the target of a symlink, never the link itself
    static std::string write_target(const std::string& filePath, std::error_code& ec) {
        fs::file_status link = fs::symlink_status(filePath, ec);
        if (ec) return "";
        if (!fs::is_symlink(link)) return filePath;
        fs::path real = fs::canonical(filePath, ec);
        return ec ? "" : real.string();
    }

    static bool backup(const std::string& filePath, std::error_code& ec) {
        fs::copy_file(filePath, journal_path(filePath), fs::copy_options::overwrite_existing, ec);
        return !ec;
    }

    // Write to a sibling temp file, then rename over the target.
    static bool write_atomic(const std::string& filePath, const std::string& content, std::error_code& ec) {
        const std::string tmp = temp_path(filePath);
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                ec = std::make_error_code(std::errc::permission_denied);
                return false;
            }
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            out.flush();
            if (!out) {
                ec = std::make_error_code(std::errc::io_error);
                std::error_code ignored;
                fs::remove(tmp, ignored);
                return false;
            }
        }
        // The swapped-in file keeps the mode bits of the one it replaces
        std::error_code mode_ec;
        fs::file_status original = fs::status(filePath, mode_ec);
        if (!mode_ec) {
            fs::permissions(tmp, original.permissions(), fs::perm_options::replace, ec);
            if (ec) {
                std::error_code ignored;
                fs::remove(tmp, ignored);
                return false;
            }
        }
        fs::rename(tmp, filePath, ec);
        if (ec) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return false;
        }
        return true;
    }

    static void commit(const std::string& filePath) {
        std::error_code ec;
        fs::remove(journal_path(filePath), ec);
    }

    static bool rollback(const std::string& filePath) {
        std::error_code ec;
        fs::path journal = journal_path(filePath);
        if (!fs::exists(journal, ec)) return false;
        fs::copy_file(journal, filePath, fs::copy_options::overwrite_existing, ec);
        if (ec) return false;
        fs::remove(journal, ec);
        return true;
    }
};
}
