/**
 * @file filesystem.hpp
 * @brief Filesystem access used by consolidation
 *
 * Every mutation performed by a MoveTransaction or a deletion goes through
 * IFileSystem, so tests can drive the transaction with an implementation
 * that fails on demand. The holding directory cleanup uses it as well.
 */

#ifndef FILESYSTEM_HPP
#define FILESYSTEM_HPP

#include <cstdint>
#include <filesystem>

class IFileSystem {
public:
    /** @throws FileOperationError */
    virtual std::uintmax_t fileSize(const std::filesystem::path& path) const = 0;

    /**
     * @brief Free bytes available to the caller on the filesystem that
     *        would hold path
     *
     * path itself need not exist; the nearest existing ancestor is queried.
     *
     * @throws FileOperationError
     */
    virtual std::uintmax_t availableSpace(const std::filesystem::path& path) const = 0;

    /** @brief Creates dir and its parents; succeeds if it already exists */
    virtual void createDirectories(const std::filesystem::path& dir) = 0;

    /**
     * @brief Moves a file; never replaces an existing destination
     *
     * @throws PermissionDeniedError, FileOperationError
     */
    virtual void move(const std::filesystem::path& source,
                      const std::filesystem::path& destination) = 0;

    /** @throws PermissionDeniedError, FileOperationError */
    virtual void remove(const std::filesystem::path& path) = 0;

    /**
     * @brief Removes a directory tree
     *
     * @return the number of entries removed; 0 if dir does not exist
     * @throws PermissionDeniedError, FileOperationError
     */
    virtual std::uintmax_t removeAll(const std::filesystem::path& dir) = 0;

    virtual bool exists(const std::filesystem::path& path) const = 0;

    virtual ~IFileSystem() = default;
};

/**
 * @class LocalFileSystem
 * @brief IFileSystem over std::filesystem
 *
 * Moves use rename(2) and fall back to copy plus remove when source and
 * destination are on different filesystems. OS errors are mapped to
 * PermissionDeniedError (EACCES, EPERM) or FileOperationError.
 */
class LocalFileSystem : public IFileSystem {
public:
    std::uintmax_t fileSize(const std::filesystem::path& path) const override;
    std::uintmax_t availableSpace(const std::filesystem::path& path) const override;
    void createDirectories(const std::filesystem::path& dir) override;
    void move(const std::filesystem::path& source,
              const std::filesystem::path& destination) override;
    void remove(const std::filesystem::path& path) override;
    std::uintmax_t removeAll(const std::filesystem::path& dir) override;
    bool exists(const std::filesystem::path& path) const override;
};

#endif // FILESYSTEM_HPP
