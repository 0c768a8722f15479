#ifndef PATHSAFETY_HPP
#define PATHSAFETY_HPP

#include <string>
#include <unordered_set>
#include <vector>

/**
 * @brief Refuses destructive operations on paths that must never be touched
 *
 * Used before deleting a confirmed duplicate and before accepting a holding
 * directory.
 */
class PathSafety {
public:
    enum class Status {
        Allowed,
        BlockedSystemPath,
        BlockedHome,
        BlockedMountPoint,
        BlockedVirtualFS
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
    };

    /**
     * @brief Check whether a file may be deleted
     * @param path Path to check; made absolute and normalized first
     */
    static Status checkDeletion(const std::string& path);

    /**
     * @brief Check whether a directory may serve as holding directory
     *
     * The directory need not exist. System paths, the home directory itself
     * and mount points are refused.
     */
    static Status checkHoldingDir(const std::string& path);

    /**
     * @brief Human-readable message for a status
     */
    static std::string getStatusMessage(Status status, const std::string& path);

    static bool isSystemPath(const std::string& path);
    static bool isUserHome(const std::string& path);
    static bool isMountPoint(const std::string& path);

    /**
     * @brief Check if path is on a kernel pseudo filesystem (proc, sys, ...)
     */
    static bool isProtectedFilesystem(const std::string& path);

    /**
     * @brief All mounts listed in /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

    /**
     * @brief Absolute, normalized form without trailing separator
     */
    static std::string normalize(const std::string& path);

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
};

#endif // PATHSAFETY_HPP
