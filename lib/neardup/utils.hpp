/**
 * @file utils.hpp
 * @brief Small helpers shared by the library and the command line front end
 *
 * Key utilities:
 * - safe_at: Bounds-checked vector element access
 * - formatBytes: Human-readable byte counts
 * - isWithin: Lexical path containment test
 * - formatPreview: Head of a file for display
 *
 * @see safe_at()
 * @see formatBytes()
 */

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cstddef> // size_t
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Safely accesses a vector element with bounds checking
 *
 * Returns nullptr if the index is out of bounds. Used for operator supplied
 * indices (keeper override, file selection) in interactive mode.
 *
 * @tparam T The type of elements stored in the vector
 * @param vec The vector to access
 * @param index The index to access (can be negative or out of bounds)
 *
 * @return const T* Pointer to the element, or nullptr if out of bounds
 *
 * Example usage:
 * @code
 * const FileRecord* keeper = safe_at(records, choice - 1);
 * if (keeper) {
 *     plan = planner.plan(records, keeper->getPath(), groupId);
 * }
 * @endcode
 */
template <typename T>
const T *safe_at(const std::vector<T> &vec, int index) {
  if (index < 0 || static_cast<size_t>(index) >= vec.size())
    return nullptr;
  return &vec[static_cast<size_t>(index)];
}

/**
 * @brief Formats byte count into human-readable size string
 *
 * Uses binary units (1024 bytes = 1 KB) and one decimal place, up to TB.
 *
 * Example outputs:
 * - formatBytes(0) → "0 B"
 * - formatBytes(512) → "512.0 B"
 * - formatBytes(1536) → "1.5 KB"
 * - formatBytes(1073741824) → "1.0 GB"
 */
inline std::string formatBytes(std::uintmax_t bytes) {
  if (bytes == 0)
    return "0 B";

  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  int unit = 0;
  double size = static_cast<double>(bytes);

  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    unit++;
  }

  char buf[32];
  snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
  return std::string(buf);
}

/**
 * @brief Checks whether a path lies inside (or equals) a directory
 *
 * Purely lexical: both paths are normalized but not resolved against the
 * filesystem, so callers pass already-resolved absolute paths.
 */
inline bool isWithin(const std::filesystem::path &path,
                     const std::filesystem::path &dir) {
  auto p = path.lexically_normal();
  auto d = dir.lexically_normal();

  auto pit = p.begin();
  for (auto dit = d.begin(); dit != d.end(); ++dit) {
    // trailing separator yields an empty element
    if (dit->empty())
      continue;
    if (pit == p.end() || *pit != *dit)
      return false;
    ++pit;
  }
  return true;
}

/**
 * @brief Shortens text to a few lines for display
 *
 * Keeps at most maxLines lines and cuts each one after maxChars characters
 * (bytes). The marker is appended to every cut line and, as a line of its
 * own, when lines were dropped.
 */
inline std::string formatPreview(const std::string &text, std::size_t maxLines,
                                 std::size_t maxChars,
                                 const std::string &marker = "...") {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos)
      end = text.size();
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  // a trailing newline does not open another line
  if (lines.size() > 1 && lines.back().empty())
    lines.pop_back();

  std::string result;
  const std::size_t shown = std::min(lines.size(), maxLines);
  for (std::size_t i = 0; i < shown; ++i) {
    if (i > 0)
      result += '\n';
    if (lines[i].size() > maxChars)
      result += lines[i].substr(0, maxChars) + marker;
    else
      result += lines[i];
  }
  if (lines.size() > maxLines)
    result += '\n' + marker;
  return result;
}

#endif // UTILS_HPP
