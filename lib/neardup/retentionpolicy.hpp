/**
 * @file retentionpolicy.hpp
 * @brief Deterministic choice of the file to keep in a duplicate group
 */

#ifndef RETENTIONPOLICY_HPP
#define RETENTIONPOLICY_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "filerecord.hpp"

/**
 * @class RetentionPolicy
 * @brief Selects exactly one keeper among a group's files
 *
 * Selection order:
 *  1. If priority-first is set, the first priority pattern (in declared
 *     order) that matches any candidate (in input order) picks that
 *     candidate.
 *  2. Otherwise the strategy decides: newest or oldest modification time,
 *     largest or smallest size, or shortest path relative to the base
 *     directory.
 *
 * Ties always go to the candidate listed first, so the same input yields
 * the same keeper on every run.
 */
class RetentionPolicy {
public:
  explicit RetentionPolicy(
      RetentionConfig config = RetentionConfig(),
      std::optional<std::filesystem::path> baseDir = std::nullopt);

  const RetentionConfig &getConfig() const { return m_config; }

  /**
   * @brief Index of the keeper within candidates
   *
   * @throws InvalidArgumentError if candidates is empty
   */
  std::size_t selectKeeperIndex(const std::vector<FileRecord> &candidates) const;

  /**
   * @brief The keeper itself
   *
   * @throws InvalidArgumentError if candidates is empty
   */
  const FileRecord &selectKeeper(const std::vector<FileRecord> &candidates) const;

  /**
   * @brief Glob match anchored at the right end of the path
   *
   * A relative pattern with n components matches when the last n path
   * components match component by component ("important/<name>" matches
   * ".../important/notes.txt"). An absolute pattern must match the whole
   * path. Components are matched with fnmatch(3).
   */
  static bool matchesPattern(const std::string &path,
                             const std::string &pattern);

private:
  std::size_t pathLength(const std::string &path) const;

  RetentionConfig m_config;
  std::optional<std::filesystem::path> m_baseDir;
};

#endif // RETENTIONPOLICY_HPP
