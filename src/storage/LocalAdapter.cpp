#include "storage/LocalAdapter.hpp"
#include "storage/StorageException.hpp"
#include "util/path.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

using namespace cairn::logging;
namespace fs = std::filesystem;

namespace cairn::storage {

namespace {

bool ensureParentDirectory(const std::string& abs) {
    const auto parent = fs::path(abs).parent_path();
    if (parent.empty()) return true;

    std::error_code ec;
    if (fs::is_directory(parent, ec)) return true;
    fs::create_directories(parent, ec);
    if (ec) {
        LogRegistry::fs()->error("[LocalAdapter] Failed to create parent directory {}: {}", parent.string(), ec.message());
        return false;
    }
    return true;
}

}

LocalAdapter::LocalAdapter(std::string root) : root_(std::move(root)) {
    while (!root_.empty() && root_.back() == '/') root_.pop_back();
}

std::string LocalAdapter::absolutePath(const std::string& rel) const {
    std::string normalized;
    const auto status = util::normalizePath(rel, normalized);
    if (status == util::PathStatus::Ok) return root_ + "/" + normalized;

    LogRegistry::storage()->warn("[LocalAdapter] Rejected path ({}): {}", util::to_string(status), rel);
    if (status == util::PathStatus::Traversal)
        throw StorageException(StorageErrc::DirectoryTraversal, *this, rel);
    throw StorageException(StorageErrc::InvalidPath, *this, rel);
}

bool LocalAdapter::exists(const std::string& rel) const {
    std::error_code ec;
    return fs::exists(absolutePath(rel), ec);
}

std::string LocalAdapter::path(const std::string& rel) const {
    if (!exists(rel)) throw StorageException(StorageErrc::DoesNotExist, *this, rel);
    return absolutePath(rel);
}

std::string LocalAdapter::read(const std::string& rel) const {
    const auto abs = path(rel);

    std::ifstream in(abs, std::ios::binary);
    if (!in) {
        LogRegistry::fs()->warn("[LocalAdapter] Failed to open {} for reading", abs);
        return {};
    }

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        LogRegistry::fs()->warn("[LocalAdapter] Failed to read {}", abs);
        return {};
    }
    return content;
}

bool LocalAdapter::write(const std::string& rel, const std::string& content, const WriteConfig& config) {
    if (exists(rel) && !config.overwrite) {
        LogRegistry::storage()->debug("[LocalAdapter] Refusing to overwrite {}", rel);
        throw StorageException(StorageErrc::AlreadyExists, *this, rel);
    }

    const auto abs = absolutePath(rel);
    if (!ensureParentDirectory(abs)) return false;

    std::ofstream out(abs, std::ios::binary | std::ios::trunc);
    if (!out) {
        LogRegistry::fs()->error("[LocalAdapter] Failed to open {} for writing", abs);
        return false;
    }

    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        LogRegistry::fs()->error("[LocalAdapter] Failed to write {} bytes to {}", content.size(), abs);
        return false;
    }

    return !content.empty();
}

bool LocalAdapter::remove(const std::string& rel) {
    const auto abs = path(rel);

    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(abs, ec))) {
        LogRegistry::fs()->warn("[LocalAdapter] Not removing directory {}, use deleteDirectory", abs);
        return false;
    }

    if (::unlink(abs.c_str()) != 0) {
        LogRegistry::fs()->error("[LocalAdapter] unlink {} failed: {}", abs, std::strerror(errno));
        return false;
    }
    return true;
}

std::uintmax_t LocalAdapter::size(const std::string& rel) const {
    const auto abs = path(rel);

    std::error_code ec;
    const auto sz = fs::file_size(abs, ec);
    if (ec) {
        LogRegistry::fs()->warn("[LocalAdapter] Failed to stat size of {}: {}", abs, ec.message());
        return 0;
    }
    return sz;
}

std::time_t LocalAdapter::lastModified(const std::string& rel) const {
    const auto abs = path(rel);

    struct stat st{};
    if (::stat(abs.c_str(), &st) != 0) {
        LogRegistry::fs()->warn("[LocalAdapter] stat {} failed: {}", abs, std::strerror(errno));
        return 0;
    }
    return st.st_mtime;
}

bool LocalAdapter::copy(const std::string& from, const std::string& to) {
    const auto src = absolutePath(from);
    const auto dst = absolutePath(to);

    std::error_code ec;
    if (!fs::exists(src, ec)) return false;
    if (!ensureParentDirectory(dst)) return false;

    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LogRegistry::fs()->error("[LocalAdapter] Failed to copy {} to {}: {}", src, dst, ec.message());
        return false;
    }
    return true;
}

bool LocalAdapter::move(const std::string& from, const std::string& to) {
    const auto src = absolutePath(from);
    const auto dst = absolutePath(to);

    std::error_code ec;
    if (!fs::exists(src, ec)) return false;
    if (!ensureParentDirectory(dst)) return false;

    if (::rename(src.c_str(), dst.c_str()) == 0) return true;

    if (errno != EXDEV) {
        LogRegistry::fs()->error("[LocalAdapter] rename {} to {} failed: {}", src, dst, std::strerror(errno));
        return false;
    }

    // different filesystems, fall back to copy then delete
    fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LogRegistry::fs()->error("[LocalAdapter] Cross-device copy {} to {} failed: {}", src, dst, ec.message());
        return false;
    }

    fs::remove_all(src, ec);
    if (ec) {
        LogRegistry::fs()->error("[LocalAdapter] Removing {} after cross-device move failed: {}", src, ec.message());
        return false;
    }
    return true;
}

std::vector<std::string> LocalAdapter::files(const std::string& directory, const bool recursive) const {
    return listing(directory, recursive, false);
}

std::vector<std::string> LocalAdapter::directories(const std::string& directory, const bool recursive) const {
    return listing(directory, recursive, true);
}

std::vector<std::string> LocalAdapter::listing(const std::string& directory, const bool recursive,
                                               const bool wantDirectories) const {
    const auto abs = absolutePath(directory);
    std::vector<std::string> out;

    std::error_code ec;
    if (!fs::is_directory(abs, ec)) {
        LogRegistry::fs()->warn("[LocalAdapter] Cannot list {}: not a directory", abs);
        return out;
    }

    const auto collect = [&](const fs::directory_entry& entry) {
        std::error_code typeEc;
        if (entry.is_directory(typeEc) == wantDirectories) out.push_back(entry.path().string());
    };

    constexpr auto opts = fs::directory_options::skip_permission_denied;
    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(abs, opts, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
            collect(*it);
    } else {
        for (auto it = fs::directory_iterator(abs, opts, ec);
             !ec && it != fs::directory_iterator(); it.increment(ec))
            collect(*it);
    }

    if (ec) LogRegistry::fs()->warn("[LocalAdapter] Listing {} stopped early: {}", abs, ec.message());

    std::ranges::sort(out, util::naturalCaseLess);
    return out;
}

bool LocalAdapter::createDirectory(const std::string& rel) {
    const auto abs = absolutePath(rel);

    std::error_code ec;
    const bool created = fs::create_directories(abs, ec);
    if (ec) {
        LogRegistry::fs()->error("[LocalAdapter] Failed to create directory {}: {}", abs, ec.message());
        return false;
    }
    return created;
}

bool LocalAdapter::deleteDirectory(const std::string& rel) {
    const auto abs = absolutePath(rel);

    std::error_code ec;
    if (!fs::is_directory(abs, ec)) throw StorageException(StorageErrc::InvalidDirectory, *this, rel);

    fs::remove(abs, ec);
    if (ec) {
        LogRegistry::fs()->warn("[LocalAdapter] Failed to delete directory {}: {}", abs, ec.message());
        return false;
    }
    return true;
}

} // namespace cairn::storage
