/**
 * @file application.hpp
 * @brief Command line front end of neardup
 */

#ifndef APPLICATION_HPP
#define APPLICATION_HPP

#include <atomic>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "filesystem.hpp"
#include "logger.hpp"
#include "movetransaction.hpp"
#include "pipeline.hpp"
#include "reportview.hpp"

/**
 * @brief Everything parsed from the command line
 */
struct CliOptions {
  std::vector<std::filesystem::path> paths;
  bool interactive = true;
  PipelineConfig config;
  PreviewConfig preview;
  std::optional<std::filesystem::path> logFile;
  bool verbose = false;
  bool help = false;
};

/**
 * @class Application
 * @brief Scans the given paths and walks the operator through the groups
 *
 * In interactive mode every group is shown with its keeper. The operator may
 * keep all files (dissolving the group), move or delete a selection of the
 * members (all but the keeper by default), inspect pairwise similarities or
 * file previews, pick another keeper by number, skip, or quit. A cleanup
 * phase then lists the moved files per holding directory and offers to
 * delete the holding directory. Non-interactive mode consolidates all groups
 * in one transaction.
 *
 * Exit codes:
 *  - 0: finished, or nothing to do
 *  - 1: invalid arguments or an aborted operation
 *  - 130: cancelled by SIGINT
 */
class Application {
public:
  static constexpr int EXIT_OK = 0;
  static constexpr int EXIT_ABORT = 1;
  static constexpr int EXIT_CANCELLED = 130;

  /**
   * @param view Renders the panels
   * @param fileSystem Receives every move, deletion and cleanup
   */
  Application(ReportView &view, IFileSystem &fileSystem,
              std::istream &in = std::cin, std::ostream &out = std::cout,
              Logger &logger = Logger::instance())
      : m_view(view), m_fs(fileSystem), m_in(in), m_out(out),
        m_logger(logger) {}

  /**
   * @brief Parses argv
   *
   * @throws InvalidArgumentError for unknown flags, missing or malformed
   *         values and a missing path
   * @throws InvalidStrategyError for an unknown --retention value
   */
  static CliOptions parseArguments(int argc, char *argv[]);

  static std::string usage(const std::string &program);

  int run(const CliOptions &options, const std::atomic<bool> *cancel = nullptr);

private:
  int runInteractive(Pipeline &pipeline, const CliOptions &options);
  int runNonInteractive(Pipeline &pipeline, const CliOptions &options);

  /**
   * @brief Lists pending moves by destination directory and offers to delete
   *        the holding directory
   */
  void cleanup(const std::vector<MoveOperation> &pending,
               const CliOptions &options);

  /** @brief Reads one line; std::nullopt at end of input */
  std::optional<std::string> prompt(const std::string &question);
  bool confirm(const std::string &question);

  /**
   * @brief Asks which group members to act on
   *
   * Accepts space separated numbers from the group table, "all" or "none";
   * an empty answer selects every file except the keeper.
   *
   * @return the selection (empty for "none" or invalid input), or
   *         std::nullopt at end of input
   */
  std::optional<std::vector<std::string>>
  selectFiles(const DuplicateGroup &group, const std::string &keeper,
              const std::string &verb);

  void showPreview(const std::vector<std::string> &files,
                   const PreviewConfig &preview);

  ReportView &m_view;
  IFileSystem &m_fs;
  std::istream &m_in;
  std::ostream &m_out;
  Logger &m_logger;
  const std::atomic<bool> *m_cancel = nullptr;
};

#endif // APPLICATION_HPP
