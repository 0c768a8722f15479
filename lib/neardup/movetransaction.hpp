/**
 * @file movetransaction.hpp
 * @brief Planning and all-or-nothing execution of consolidation moves
 */

#ifndef MOVETRANSACTION_HPP
#define MOVETRANSACTION_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "filesystem.hpp"
#include "logger.hpp"

/**
 * @brief One planned file move
 *
 * executed is set only once the move succeeded and cleared again if the
 * move is rolled back.
 */
struct MoveOperation {
  std::filesystem::path source;
  std::filesystem::path destination;
  int groupId = 0;
  std::chrono::system_clock::time_point timestamp =
      std::chrono::system_clock::now();
  bool executed = false;
};

/**
 * @class MovePlanner
 * @brief Computes destinations below the holding directory
 *
 * With structure preservation a file keeps its path relative to the base
 * directory (or, without one, to the common parent of the group's files).
 * Files outside the base, and every file when structure is not preserved,
 * land directly in the holding directory under their own name. Colliding
 * destinations get "_1", "_2", ... inserted before the extension.
 */
class MovePlanner {
public:
  /**
   * @throws InvalidArgumentError if config is invalid
   */
  explicit MovePlanner(MoveConfig config = {});

  const MoveConfig &getConfig() const { return m_config; }

  /**
   * @brief Plans the moves of one group
   *
   * @param files All files of the group, keeper included
   * @param keeper The file that stays; never planned
   * @param groupId Recorded in each MoveOperation
   * @param holdingDir Overrides the configured holding directory
   */
  std::vector<MoveOperation>
  plan(const std::vector<std::string> &files,
       const std::optional<std::string> &keeper, int groupId,
       const std::optional<std::filesystem::path> &holdingDir =
           std::nullopt) const;

  /**
   * @brief Deepest directory containing every given file
   */
  static std::filesystem::path
  commonParent(const std::vector<std::string> &files);

private:
  MoveConfig m_config;
};

/**
 * @class MoveTransaction
 * @brief Executes a batch of moves with preflight and rollback
 *
 * execute() first checks that every destination directory has room for the
 * files headed there, then performs the moves in order. If a move fails,
 * the moves already done are undone in reverse order and the original
 * exception is rethrown. A failing undo is logged and counted but never
 * replaces that exception.
 *
 * An empty batch succeeds without touching the filesystem.
 *
 * Every completed, and every rolled back, move is logged with the fields
 * operation, source, destination, group_id and status.
 */
class MoveTransaction {
public:
  explicit MoveTransaction(IFileSystem &fileSystem,
                           Logger &logger = Logger::instance());

  /**
   * @throws InsufficientSpaceError if preflight fails (nothing was moved)
   * @throws PermissionDeniedError, FileOperationError or whatever the
   *         filesystem threw for the failing move, after rollback
   */
  void execute(std::vector<MoveOperation> &moves);

  /**
   * @brief Free-space check alone
   *
   * @throws InsufficientSpaceError
   */
  void preflight(const std::vector<MoveOperation> &moves) const;

  /** @brief Undo failures of the last execute() */
  std::size_t getRollbackFailures() const { return m_rollbackFailures; }

private:
  void rollback(const std::vector<MoveOperation *> &completed);
  void logMove(const MoveOperation &move, const std::string &operation,
               const std::string &status);

  IFileSystem &m_fs;
  Logger &m_logger;
  std::size_t m_rollbackFailures = 0;
};

#endif // MOVETRANSACTION_HPP
