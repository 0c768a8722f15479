#include "retentionpolicy.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <fnmatch.h>

#include <utility>

namespace {

/** Splits a path into its non-empty components; a leading "/" is kept */
std::vector<std::string> components(const std::string &path) {
  std::vector<std::string> parts;
  if (!path.empty() && path.front() == '/')
    parts.emplace_back("/");

  std::string current;
  for (char c : path) {
    if (c == '/') {
      if (!current.empty())
        parts.push_back(std::move(current));
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty())
    parts.push_back(std::move(current));
  return parts;
}

} // namespace

RetentionPolicy::RetentionPolicy(RetentionConfig config,
                                 std::optional<std::filesystem::path> baseDir)
    : m_config(std::move(config)), m_baseDir(std::move(baseDir)) {}

bool RetentionPolicy::matchesPattern(const std::string &path,
                                     const std::string &pattern) {
  const auto pathParts = components(path);
  const auto patternParts = components(pattern);

  if (patternParts.empty() || patternParts.size() > pathParts.size())
    return false;

  const bool absolute = patternParts.front() == "/";
  if (absolute && patternParts.size() != pathParts.size())
    return false;

  const std::size_t offset = pathParts.size() - patternParts.size();
  for (std::size_t i = 0; i < patternParts.size(); ++i) {
    const std::string &part = pathParts[offset + i];
    const std::string &glob = patternParts[i];
    if (glob == "/" || part == "/") {
      if (glob != part)
        return false;
      continue;
    }
    if (::fnmatch(glob.c_str(), part.c_str(), 0) != 0)
      return false;
  }
  return true;
}

std::size_t RetentionPolicy::pathLength(const std::string &path) const {
  if (m_baseDir && isWithin(path, *m_baseDir)) {
    auto relative =
        std::filesystem::path(path).lexically_relative(*m_baseDir);
    return relative.string().size();
  }
  return path.size();
}

std::size_t
RetentionPolicy::selectKeeperIndex(const std::vector<FileRecord> &candidates) const {
  if (candidates.empty())
    throw InvalidArgumentError("No files provided");

  if (m_config.isPriorityFirst()) {
    for (const auto &pattern : m_config.getPriorityPatterns()) {
      for (std::size_t i = 0; i < candidates.size(); ++i) {
        if (matchesPattern(candidates[i].getPath(), pattern))
          return i;
      }
    }
  }

  std::size_t best = 0;
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    const FileRecord &c = candidates[i];
    const FileRecord &b = candidates[best];
    bool better = false;

    // strict comparisons keep the earlier candidate on ties
    switch (m_config.getStrategy()) {
    case RetentionStrategy::Newest:
      better = c.getModifiedTime() > b.getModifiedTime();
      break;
    case RetentionStrategy::Oldest:
      better = c.getModifiedTime() < b.getModifiedTime();
      break;
    case RetentionStrategy::Largest:
      better = c.getFileSize() > b.getFileSize();
      break;
    case RetentionStrategy::Smallest:
      better = c.getFileSize() < b.getFileSize();
      break;
    case RetentionStrategy::ShortestRelativePath:
      better = pathLength(c.getPath()) < pathLength(b.getPath());
      break;
    }

    if (better)
      best = i;
  }
  return best;
}

const FileRecord &
RetentionPolicy::selectKeeper(const std::vector<FileRecord> &candidates) const {
  return candidates[selectKeeperIndex(candidates)];
}
