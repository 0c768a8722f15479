/**
 * @file filesystem.cpp
 * @brief std::filesystem backed implementation of IFileSystem
 */

#include "filesystem.hpp"
#include "errors.hpp"

#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Converts an OS error into the matching exception
 */
[[noreturn]] void throwFileError(const std::error_code& ec, const fs::path& path,
                                 const std::string& operation) {
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted) {
        throw PermissionDeniedError(path.string(), operation);
    }
    throw FileOperationError(ec.message(), path.string(), operation);
}

} // namespace

std::uintmax_t LocalFileSystem::fileSize(const fs::path& path) const {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        throwFileError(ec, path, "stat");
    }
    return size;
}

/**
 * @brief Free space for a path that may not exist yet
 *
 * Walks up from path until an existing directory is found and queries
 * the space available to unprivileged users there.
 */
std::uintmax_t LocalFileSystem::availableSpace(const fs::path& path) const {
    std::error_code ec;
    fs::path existing = fs::absolute(path, ec);
    if (ec) {
        throwFileError(ec, path, "space check");
    }

    while (!fs::exists(existing, ec) && existing.has_parent_path() &&
           existing != existing.parent_path()) {
        existing = existing.parent_path();
    }

    auto info = fs::space(existing, ec);
    if (ec) {
        throwFileError(ec, existing, "space check");
    }
    return info.available;
}

void LocalFileSystem::createDirectories(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throwFileError(ec, dir, "mkdir");
    }
}

void LocalFileSystem::move(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    if (fs::exists(fs::symlink_status(destination, ec))) {
        throw FileOperationError("destination already exists",
                                 destination.string(), "move");
    }

    fs::rename(source, destination, ec);
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throwFileError(ec, source, "move");
    }

    // Different filesystems: copy, then drop the original
    ec.clear();
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) {
        throwFileError(ec, source, "move");
    }

    fs::remove(source, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(destination, cleanup);
        throwFileError(ec, source, "move");
    }
}

void LocalFileSystem::remove(const fs::path& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throwFileError(ec, path, "delete");
    }
    if (!removed) {
        throw FileOperationError("No such file or directory", path.string(),
                                 "delete");
    }
}

std::uintmax_t LocalFileSystem::removeAll(const fs::path& dir) {
    std::error_code ec;
    std::uintmax_t removed = fs::remove_all(dir, ec);
    if (ec) {
        throwFileError(ec, dir, "delete");
    }
    return removed;
}

bool LocalFileSystem::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}
