/**
 * @file config.hpp
 * @brief Immutable per-run configuration structs
 *
 * Every struct carries its defaults inline and a validate() method that
 * throws InvalidArgumentError on malformed values. Components validate the
 * configuration they are constructed with, so an invalid value is reported
 * once, up front, instead of surfacing mid-scan.
 */

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Symlink resolution settings
 */
struct ResolverConfig {
  /** @brief When false every symlink is rejected; plain paths still resolve */
  bool followSymlinks = true;

  /** @brief Maximum number of link hops followed before giving up */
  int maxDepth = 10;

  /** @brief If set, every resolved target must lie inside this directory */
  std::optional<std::filesystem::path> boundary;

  void validate() const;
};

/**
 * @brief MinHash signature settings
 */
struct SignatureConfig {
  /** @brief Shingle width k in bytes of normalized text */
  std::size_t shingleSize = 5;

  /** @brief Sketch size N (number of hash permutations) */
  std::size_t numPerm = 128;

  /** @brief Texts larger than this are signed on the worker pool */
  std::size_t parallelThreshold = 1024 * 1024;

  /** @brief Chunk size for the parallel path */
  std::size_t chunkSize = 1024 * 1024;

  /** @brief Worker pool size; 0 selects the hardware concurrency */
  std::size_t workers = 0;

  /** @brief Seed for the permutation coefficients */
  std::uint64_t seed = 1;

  void validate() const;

  /** @brief Resolved pool size, never 0 */
  std::size_t effectiveWorkers() const;
};

/**
 * @brief How a new file's similarity to an existing group is recorded
 *
 * - Representative: compare against one member per existing component and
 *   give every member of a matching component the representative's weight.
 *   O(new x components) comparisons.
 * - Exact: compare against every existing node. O(new x existing).
 */
enum class EdgePropagation { Representative, Exact };

struct GraphConfig {
  /** @brief Inclusive similarity threshold in (0, 1] */
  double threshold = 0.85;

  EdgePropagation propagation = EdgePropagation::Representative;

  void validate() const;
};

enum class RetentionStrategy {
  Newest,
  Oldest,
  ShortestRelativePath,
  Largest,
  Smallest
};

/**
 * @brief Keeper selection settings
 *
 * Constructed through create() when the strategy comes from user input; the
 * object has no setters.
 */
class RetentionConfig {
public:
  explicit RetentionConfig(
      RetentionStrategy strategy = RetentionStrategy::Newest,
      std::vector<std::string> priorityPatterns = {},
      bool priorityFirst = false);

  /**
   * @brief Builds a config from a strategy name
   *
   * @throws InvalidStrategyError if the name is not a known strategy
   * @throws InvalidArgumentError if a priority pattern is empty
   */
  static RetentionConfig create(const std::string &strategy,
                                std::vector<std::string> priorityPatterns = {},
                                bool priorityFirst = false);

  /**
   * @brief Maps a strategy name to its enum value
   *
   * Accepts newest, oldest, shortest-relative-path (alias shortest_path),
   * largest and smallest.
   *
   * @throws InvalidStrategyError for anything else
   */
  static RetentionStrategy parseStrategy(const std::string &name);
  static std::string strategyName(RetentionStrategy strategy);

  RetentionStrategy getStrategy() const { return m_strategy; }
  const std::vector<std::string> &getPriorityPatterns() const {
    return m_priorityPatterns;
  }
  bool isPriorityFirst() const { return m_priorityFirst; }

private:
  RetentionStrategy m_strategy;
  std::vector<std::string> m_priorityPatterns;
  bool m_priorityFirst;
};

/**
 * @brief Consolidation (move) settings
 */
struct MoveConfig {
  std::filesystem::path holdingDir = "holding";

  /** @brief Keep the source layout below the holding directory */
  bool preserveStructure = true;

  /** @brief Root the preserved layout is taken relative to */
  std::optional<std::filesystem::path> baseDir;

  /** @brief Plan and report only; the filesystem is never touched */
  bool dryRun = false;

  void validate() const;
};

/**
 * @brief Discovery settings
 */
struct ScanConfig {
  /** @brief Lower-case extensions (with dot); empty accepts every file */
  std::set<std::string> allowedExtensions = {".txt", ".md", ".log", ".csv"};

  /** @brief Minimum printable-or-space share of the first 8 KiB */
  double minPrintableRatio = 0.8;

  /** @brief Skip zero-length files */
  bool skipEmpty = true;

  ResolverConfig resolver;

  void validate() const;
};

/**
 * @brief File preview shown in the interactive report
 */
struct PreviewConfig {
  std::size_t maxChars = 100;
  std::size_t maxLines = 3;
  std::string truncationMarker = "...";

  void validate() const;
};

struct PipelineConfig {
  ScanConfig scan;
  SignatureConfig signature;
  GraphConfig graph;
  RetentionConfig retention;
  MoveConfig move;

  void validate() const;
};

#endif // CONFIG_HPP
