/**
 * @file filescanner.hpp
 * @brief Discovery of candidate text files
 *
 * This header defines the FileScanner class, which walks the given paths,
 * filters out everything that is not a comparable text file and returns
 * signed FileRecords.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <atomic>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <vector>

#include "config.hpp"
#include "filerecord.hpp"
#include "logger.hpp"
#include "signatureengine.hpp"
#include "symlinkresolver.hpp"
#include "textdetector.hpp"

/**
 * @class FileScanner
 * @brief Walks files and directories and signs every candidate text file
 *
 * For each path given, a regular file is analyzed directly and a directory
 * is walked recursively. An entry becomes a FileRecord when
 * - its extension is allowed (empty allow-list accepts everything),
 * - symlinks resolve through the SymlinkResolver (and following them is
 *   enabled),
 * - it is not empty, unless empty files are wanted,
 * - its head passes the TextDetector,
 * - and signing succeeds.
 *
 * Anything unreadable is logged and skipped; a scan never fails because of a
 * single file. A symlink and its target yield one record, under the target's
 * path.
 *
 * @see SignatureEngine
 * @see SymlinkResolver
 */
class FileScanner {
public:
  /**
   * @brief Callback function type for progress notifications
   *
   * Receives the number of entries examined so far.
   */
  using ProgressCallback = std::function<void(int count)>;

  /**
   * @brief Constructs a scanner signing with the given engine
   *
   * @note The engine must outlive the scanner
   * @throws InvalidArgumentError if config is invalid
   */
  FileScanner(const SignatureEngine &engine, ScanConfig config = {},
              Logger &logger = Logger::instance());

  /**
   * @brief Sets an atomic counter incremented per examined entry
   */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Sets a flag that stops the scan when it becomes true
   *
   * The flag is polled between files and by the signer between read chunks.
   */
  void setCancelFlag(const std::atomic<bool> *cancel) { m_cancel = cancel; }

  bool isCancelled() const { return m_cancel && m_cancel->load(); }

  /**
   * @brief Scans files and directories
   *
   * @return records sorted by path; after cancellation only those completed
   *         before the flag was seen
   */
  std::vector<FileRecord> scan(const std::vector<std::filesystem::path> &paths,
                               ProgressCallback progress = nullptr);

  /**
   * @brief Analyzes one (non-symlink) file
   *
   * @return the signed record, or std::nullopt if the file is filtered out,
   *         unreadable, or the scan was cancelled
   */
  std::optional<FileRecord>
  analyzeFile(const std::filesystem::path &path) const;

  bool hasAllowedExtension(const std::filesystem::path &path) const;

private:
  void processEntry(const std::filesystem::path &path,
                    std::vector<FileRecord> &results,
                    std::set<std::string> &seen);

  const SignatureEngine &m_engine;
  ScanConfig m_config;
  Logger &m_logger;
  SymlinkResolver m_resolver;
  TextDetector m_detector;

  std::atomic<int> *m_progress_counter = nullptr;
  const std::atomic<bool> *m_cancel = nullptr;
};

#endif // FILESCANNER_HPP
