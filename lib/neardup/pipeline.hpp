/**
 * @file pipeline.hpp
 * @brief Discovery, clustering, retention and consolidation wired together
 */

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "filerecord.hpp"
#include "filescanner.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "movetransaction.hpp"
#include "retentionpolicy.hpp"
#include "signaturecache.hpp"
#include "signatureengine.hpp"
#include "similaritygraph.hpp"

/**
 * @brief Outcome of a consolidation run
 */
struct ConsolidationReport {
  /** @brief Group id to the path that stayed in place */
  std::map<int, std::string> keepers;

  /** @brief Planned moves; executed is set on each one that happened */
  std::vector<MoveOperation> moves;

  /** @brief Bytes planned for moving */
  std::uintmax_t bytes = 0;

  bool dryRun = false;
};

/**
 * @class Pipeline
 * @brief Runs scan -> graph -> groups -> consolidation for one session
 *
 * Owns the signature cache, engine, scanner and graph of a run. Filesystem
 * mutations go through the IFileSystem given at construction; files that
 * were moved or deleted (or planned to be, in a dry run) leave the graph, so
 * groups() only returns groups that still need a decision.
 *
 * @code
 * LocalFileSystem fs;
 * Pipeline pipeline(config, fs);
 * pipeline.scan({"/data/notes"});
 * ConsolidationReport report = pipeline.consolidateAll();
 * @endcode
 */
class Pipeline {
public:
  /**
   * @throws InvalidArgumentError if config is invalid
   */
  Pipeline(PipelineConfig config, IFileSystem &fileSystem,
           Logger &logger = Logger::instance());

  Pipeline(const Pipeline &) = delete;
  Pipeline &operator=(const Pipeline &) = delete;

  const PipelineConfig &getConfig() const { return m_config; }

  void setCancelFlag(const std::atomic<bool> *cancel);
  bool isCancelled() const { return m_cancel && m_cancel->load(); }

  /**
   * @brief Discovers and signs files and adds them to the graph
   *
   * @return the number of records added
   */
  std::size_t scan(const std::vector<std::filesystem::path> &paths,
                   FileScanner::ProgressCallback progress = nullptr);

  /** @brief Adds already discovered records */
  std::size_t addRecords(const std::vector<FileRecord> &records);

  std::vector<DuplicateGroup> groups() { return m_graph.groups(); }

  SimilarityGraph &graph() { return m_graph; }
  const SignatureEngine &engine() const { return m_engine; }

  /** @brief Record of a scanned path, or nullptr */
  const FileRecord *findRecord(const std::string &path) const;

  /**
   * @brief Records of the given paths, in the same order
   *
   * @throws InvalidArgumentError for a path that was never scanned
   */
  std::vector<FileRecord> recordsFor(const std::vector<std::string> &paths) const;

  /**
   * @brief Keeper chosen by the retention policy
   */
  std::string selectKeeper(const DuplicateGroup &group) const;

  /**
   * @brief Holding subdirectory of a group: <holding>/group_<id>
   */
  std::filesystem::path holdingDirFor(int groupId) const;

  /**
   * @brief Moves of one group
   *
   * @param keeper Replaces the policy's choice when set
   * @throws InvalidArgumentError if keeper is not a member of the group
   */
  std::vector<MoveOperation>
  planGroup(const DuplicateGroup &group,
            const std::optional<std::string> &keeper = std::nullopt) const;

  /**
   * @brief Moves of an explicit selection of group members
   *
   * Destinations are the ones planGroup() would give; a selected keeper is
   * moved like any other file.
   *
   * @throws InvalidArgumentError if a file is not a member of the group
   */
  std::vector<MoveOperation>
  planFiles(const DuplicateGroup &group,
            const std::vector<std::string> &files) const;

  /**
   * @brief Consolidates a single group
   */
  ConsolidationReport
  consolidate(const DuplicateGroup &group,
              const std::optional<std::string> &keeper = std::nullopt);

  /** @brief Moves only the selected members of a group */
  ConsolidationReport consolidateFiles(const DuplicateGroup &group,
                                       const std::vector<std::string> &files);

  /**
   * @brief Consolidates every current group in one transaction
   *
   * @param keeperOverrides group id to the file to keep instead of the
   *        policy's choice
   * @throws InvalidArgumentError if the holding directory is refused or an
   *         override is not a member of its group
   * @throws InsufficientSpaceError, PermissionDeniedError,
   *         FileOperationError if the transaction fails (after rollback)
   */
  ConsolidationReport
  consolidateAll(const std::map<int, std::string> &keeperOverrides = {});

  /**
   * @brief Deletes confirmed files
   *
   * Stops at the first failure; files deleted before it stay deleted.
   * Deleted files leave the graph, in a dry run as well.
   *
   * @return the files deleted (or, in a dry run, that would be)
   * @throws FileOperationError if PathSafety refuses a path or the
   *         deletion fails
   */
  std::vector<std::string> deleteFiles(const std::vector<std::string> &files);

private:
  ConsolidationReport run(std::vector<MoveOperation> moves,
                          std::map<int, std::string> keepers);
  void checkHoldingDir() const;
  void forget(const std::vector<std::string> &paths);

  PipelineConfig m_config;
  IFileSystem &m_fs;
  Logger &m_logger;

  SignatureCache m_cache;
  SignatureEngine m_engine;
  FileScanner m_scanner;
  SimilarityGraph m_graph;
  RetentionPolicy m_policy;
  MovePlanner m_planner;

  std::map<std::string, FileRecord> m_records;
  const std::atomic<bool> *m_cancel = nullptr;
};

#endif // PIPELINE_HPP
