/**
 * @file filescanner.cpp
 * @brief Implementation of candidate discovery
 */

#include "filescanner.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

FileScanner::FileScanner(const SignatureEngine &engine, ScanConfig config,
                         Logger &logger)
    : m_engine(engine), m_config(std::move(config)), m_logger(logger),
      m_resolver(m_config.resolver, logger),
      m_detector(m_config.minPrintableRatio) {
  m_config.validate();
}

bool FileScanner::hasAllowedExtension(const fs::path &path) const {
  if (m_config.allowedExtensions.empty())
    return true;

  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return m_config.allowedExtensions.count(ext) > 0;
}

/**
 * @brief Scans files and directories
 *
 * Directory walks skip entries the process may not read. Progress is
 * reported every 10 entries and once at the end.
 */
std::vector<FileRecord> FileScanner::scan(const std::vector<fs::path> &paths,
                                          ProgressCallback progress) {
  std::vector<FileRecord> results;
  std::set<std::string> seen;
  int count = 0;

  auto examined = [&]() {
    ++count;
    if (m_progress_counter)
      ++(*m_progress_counter);
    if (progress && count % 10 == 0)
      progress(count);
  };

  for (const auto &root : paths) {
    if (isCancelled())
      break;

    std::error_code ec;
    const auto st = fs::symlink_status(root, ec);
    if (ec || !fs::exists(st)) {
      m_logger.warning("Path does not exist: " + root.string(),
                       {{"path", root.string()}});
      continue;
    }

    if (!fs::is_directory(st)) {
      processEntry(root, results, seen);
      examined();
      continue;
    }

    fs::recursive_directory_iterator it(
        root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
      m_logger.warning("Cannot read directory " + root.string(),
                       {{"path", root.string()}, {"error", ec.message()}});
      continue;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (ec) {
        m_logger.warning("Directory walk error",
                         {{"path", root.string()}, {"error", ec.message()}});
        break;
      }
      if (isCancelled())
        break;

      const auto &entry = *it;
      std::error_code entryEc;
      if (entry.is_directory(entryEc) && !entry.is_symlink(entryEc))
        continue;

      processEntry(entry.path(), results, seen);
      examined();
    }
  }

  if (progress)
    progress(count);

  std::sort(results.begin(), results.end(),
            [](const FileRecord &a, const FileRecord &b) {
              return a.getPath() < b.getPath();
            });

  m_logger.debug("Scan finished", {{"examined", std::to_string(count)},
                                   {"candidates",
                                    std::to_string(results.size())}});
  return results;
}

void FileScanner::processEntry(const fs::path &path,
                               std::vector<FileRecord> &results,
                               std::set<std::string> &seen) {
  if (!hasAllowedExtension(path))
    return;

  auto resolved = m_resolver.resolve(path);
  if (!resolved)
    return;

  std::error_code ec;
  if (!fs::is_regular_file(*resolved, ec))
    return;

  if (!seen.insert(resolved->string()).second)
    return;

  auto record = analyzeFile(*resolved);
  if (record)
    results.push_back(std::move(*record));
}

std::optional<FileRecord> FileScanner::analyzeFile(const fs::path &path) const {
  if (!hasAllowedExtension(path))
    return std::nullopt;

  std::optional<FileRecord> record;
  try {
    record = FileRecord::fromPath(path);
  } catch (const FileOperationError &e) {
    m_logger.warning("Skipping unreadable file",
                     {{"path", path.string()}, {"error", e.what()}});
    return std::nullopt;
  }

  if (m_config.skipEmpty && record->zeroFiles())
    return std::nullopt;

  if (!m_detector.isTextFile(path)) {
    m_logger.debug("Skipping non-text file", {{"path", path.string()}});
    return std::nullopt;
  }

  auto signature = m_engine.trySignFile(path, m_cancel);
  if (!signature)
    return std::nullopt;

  record->setSignature(std::move(*signature));
  return record;
}
