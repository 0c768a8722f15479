#ifndef FILE_RECORD_HPP
#define FILE_RECORD_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "signature.hpp"

/**
 * @class FileRecord
 * @brief A candidate file that passed discovery
 *
 * Holds the absolute path, byte size and timestamps captured when the file
 * was discovered. The record is immutable except for the signature, which is
 * attached once signing succeeds and may stay absent if it fails.
 */
class FileRecord {
public:
  using Clock = std::chrono::system_clock;

private:
  std::string m_path;
  std::uintmax_t m_size;
  Clock::time_point m_modified;
  Clock::time_point m_created;
  std::optional<Signature> m_signature;

public:
  FileRecord(std::string path, std::uintmax_t size, Clock::time_point modified,
             Clock::time_point created)
      : m_path(std::move(path)), m_size(size), m_modified(modified),
        m_created(created) {}

  /**
   * @brief Builds a record from the file's current metadata
   *
   * The path is made absolute. On Linux no birth time is available through
   * stat(), so the status-change time stands in for the creation time.
   *
   * @throws FileOperationError if the file cannot be stat'ed
   */
  static FileRecord fromPath(const std::filesystem::path &path);

  const std::string &getPath() const { return m_path; }
  std::uintmax_t getFileSize() const { return m_size; }
  Clock::time_point getModifiedTime() const { return m_modified; }
  Clock::time_point getCreatedTime() const { return m_created; }

  std::string getDisplayName() const {
    return std::filesystem::path(m_path).filename().string();
  }

  bool hasSignature() const { return m_signature.has_value(); }
  const std::optional<Signature> &getSignature() const { return m_signature; }
  void setSignature(Signature signature) { m_signature = std::move(signature); }

  bool zeroFiles() const { return m_size == 0; }
};

#endif // FILE_RECORD_HPP
