/**
 * @file pathsafety.cpp
 * @brief Guards against deleting or filling protected locations
 */

#include "pathsafety.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <sys/vfs.h>

/**
 * @brief Directories that are never deleted and never used for holding
 */
const std::unordered_set<std::string> PathSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp"
};

std::string PathSafety::normalize(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p = std::filesystem::absolute(path, ec);
    if (ec) {
        p = path;
    }
    std::string result = p.lexically_normal().string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

/**
 * @brief Checks whether a file may be deleted
 *
 * Checks run in order of severity: system paths, the home directory,
 * pseudo filesystems, then mount points.
 */
PathSafety::Status PathSafety::checkDeletion(const std::string& path) {
    const std::string normalized = normalize(path);

    if (isSystemPath(normalized)) {
        return Status::BlockedSystemPath;
    }
    if (isUserHome(normalized)) {
        return Status::BlockedHome;
    }
    if (isProtectedFilesystem(normalized)) {
        return Status::BlockedVirtualFS;
    }
    if (isMountPoint(normalized)) {
        return Status::BlockedMountPoint;
    }
    return Status::Allowed;
}

PathSafety::Status PathSafety::checkHoldingDir(const std::string& path) {
    const std::string normalized = normalize(path);

    if (isSystemPath(normalized)) {
        return Status::BlockedSystemPath;
    }
    if (isUserHome(normalized)) {
        return Status::BlockedHome;
    }
    if (isMountPoint(normalized)) {
        return Status::BlockedMountPoint;
    }
    return Status::Allowed;
}

std::string PathSafety::getStatusMessage(Status status, const std::string& path) {
    switch (status) {
        case Status::Allowed:
            return "Operation allowed";
        case Status::BlockedSystemPath:
            return "Refusing to touch system directory: " + path;
        case Status::BlockedHome:
            return "Refusing to touch your home directory: " + path;
        case Status::BlockedMountPoint:
            return "Refusing to touch mount point: " + path;
        case Status::BlockedVirtualFS:
            return "Refusing to touch virtual filesystem: " + path;
    }
    return "Unknown status";
}

bool PathSafety::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

bool PathSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && path == normalize(home);
}

bool PathSafety::isMountPoint(const std::string& path) {
    for (const auto& mount : getMountPoints()) {
        if (mount.mountpoint == path) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Checks if path lives on a kernel pseudo filesystem
 *
 * Uses statfs() and compares the filesystem magic against procfs, sysfs,
 * devpts, securityfs and the cgroup filesystems. A path that cannot be
 * inspected counts as protected.
 */
bool PathSafety::isProtectedFilesystem(const std::string& path) {
    struct statfs fs_info;

    if (statfs(path.c_str(), &fs_info) != 0) {
        return true;
    }

    // See /usr/include/linux/magic.h
    const long PROTECTED_FS[] = {
        0x9fa0,       // PROC_SUPER_MAGIC
        0x62656572,   // SYSFS_MAGIC
        0x3434,       // DEVPTS_SUPER_MAGIC
        0x73636673,   // SECURITYFS_MAGIC
        0x27e0eb,     // CGROUP_SUPER_MAGIC
        0x63677270,   // CGROUP2_SUPER_MAGIC
    };

    for (auto magic : PROTECTED_FS) {
        if (fs_info.f_type == magic) {
            return true;
        }
    }
    return false;
}

std::vector<PathSafety::MountInfo> PathSafety::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return mounts;
    }

    std::string line;
    while (std::getline(mounts_file, line)) {
        std::istringstream iss(line);
        MountInfo info;
        iss >> info.device >> info.mountpoint >> info.fstype;
        if (!info.mountpoint.empty()) {
            mounts.push_back(info);
        }
    }
    return mounts;
}
