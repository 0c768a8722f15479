/**
 * @file symlinkresolver.hpp
 * @brief Bounded, cycle-safe resolution of symlink chains
 */

#ifndef SYMLINKRESOLVER_HPP
#define SYMLINKRESOLVER_HPP

#include <filesystem>
#include <optional>

#include "config.hpp"
#include "logger.hpp"

/**
 * @class SymlinkResolver
 * @brief Follows a symlink chain hop by hop to its final target
 *
 * The chain is walked in an explicit loop. Every hop is recorded in a visited
 * set and counted, so a cycle or an overly long chain ends resolution instead
 * of recursing. Relative link targets are taken relative to the directory
 * holding the link. Paths are kept lexical (made absolute and normalized);
 * they are not canonicalized.
 *
 * When a boundary is configured, every hop's target must lie inside it.
 *
 * Filesystem conditions never throw. resolve() answers with std::nullopt
 * and resolveDetailed() tells why.
 */
class SymlinkResolver {
public:
  enum class Status {
    Resolved,
    NotFound,
    CircularReference,
    DepthExceeded,
    ContainmentViolation,
    Disabled
  };

  struct Result {
    Status status;
    std::filesystem::path target; // empty unless status is Resolved
    int hops = 0;
  };

  /**
   * @throws InvalidArgumentError if config is invalid
   */
  explicit SymlinkResolver(ResolverConfig config = {},
                           Logger &logger = Logger::instance());

  const ResolverConfig &getConfig() const { return m_config; }

  /**
   * @brief Resolves path to its final, existing, non-link target
   *
   * A path that is not a symlink resolves to itself (absolute and
   * normalized) if it exists.
   *
   * @return the target, or std::nullopt when it cannot be resolved
   */
  std::optional<std::filesystem::path>
  resolve(const std::filesystem::path &path) const;

  /**
   * @brief Like resolve() but reports the reason on failure
   */
  Result resolveDetailed(const std::filesystem::path &path) const;

  static const char *statusName(Status status);

private:
  ResolverConfig m_config;
  std::optional<std::filesystem::path> m_boundary;
  Logger &m_logger;
};

#endif // SYMLINKRESOLVER_HPP
