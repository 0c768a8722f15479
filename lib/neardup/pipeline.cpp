#include "pipeline.hpp"
#include "errors.hpp"
#include "pathsafety.hpp"

#include <algorithm>
#include <utility>

namespace fs = std::filesystem;

Pipeline::Pipeline(PipelineConfig config, IFileSystem &fileSystem,
                   Logger &logger)
    : m_config(std::move(config)), m_fs(fileSystem), m_logger(logger),
      m_engine(m_config.signature, logger),
      m_scanner(m_engine, m_config.scan, logger),
      m_graph(m_cache, m_config.graph, logger),
      m_policy(m_config.retention, m_config.move.baseDir),
      m_planner(m_config.move) {
  m_config.validate();
}

void Pipeline::setCancelFlag(const std::atomic<bool> *cancel) {
  m_cancel = cancel;
  m_scanner.setCancelFlag(cancel);
}

std::size_t Pipeline::scan(const std::vector<fs::path> &paths,
                           FileScanner::ProgressCallback progress) {
  auto records = m_scanner.scan(paths, std::move(progress));
  if (isCancelled()) {
    m_logger.info("Scan cancelled",
                  {{"completed", std::to_string(records.size())}});
    return 0;
  }
  return addRecords(records);
}

std::size_t Pipeline::addRecords(const std::vector<FileRecord> &records) {
  for (const auto &record : records)
    m_records.emplace(record.getPath(), record);
  return m_graph.add(records);
}

const FileRecord *Pipeline::findRecord(const std::string &path) const {
  auto it = m_records.find(path);
  return it == m_records.end() ? nullptr : &it->second;
}

std::vector<FileRecord>
Pipeline::recordsFor(const std::vector<std::string> &paths) const {
  std::vector<FileRecord> result;
  result.reserve(paths.size());
  for (const auto &path : paths) {
    const FileRecord *record = findRecord(path);
    if (!record)
      throw InvalidArgumentError("Unknown file: " + path);
    result.push_back(*record);
  }
  return result;
}

std::string Pipeline::selectKeeper(const DuplicateGroup &group) const {
  return m_policy.selectKeeper(recordsFor(group.files)).getPath();
}

fs::path Pipeline::holdingDirFor(int groupId) const {
  return m_config.move.holdingDir / ("group_" + std::to_string(groupId));
}

std::vector<MoveOperation>
Pipeline::planGroup(const DuplicateGroup &group,
                    const std::optional<std::string> &keeper) const {
  std::string chosen;
  if (keeper) {
    if (std::find(group.files.begin(), group.files.end(), *keeper) ==
        group.files.end())
      throw InvalidArgumentError("Keeper " + *keeper +
                                 " is not a member of group " +
                                 std::to_string(group.id));
    chosen = *keeper;
  } else {
    chosen = selectKeeper(group);
  }

  return m_planner.plan(group.files, chosen, group.id, holdingDirFor(group.id));
}

std::vector<MoveOperation>
Pipeline::planFiles(const DuplicateGroup &group,
                    const std::vector<std::string> &files) const {
  for (const auto &file : files) {
    if (std::find(group.files.begin(), group.files.end(), file) ==
        group.files.end())
      throw InvalidArgumentError("File " + file + " is not a member of group " +
                                 std::to_string(group.id));
  }

  // Planned over the whole group so destinations match planGroup()
  auto all = m_planner.plan(group.files, std::nullopt, group.id,
                            holdingDirFor(group.id));
  std::vector<MoveOperation> moves;
  for (auto &move : all) {
    if (std::find(files.begin(), files.end(), move.source.string()) !=
        files.end())
      moves.push_back(std::move(move));
  }
  return moves;
}

void Pipeline::checkHoldingDir() const {
  const std::string holding = m_config.move.holdingDir.string();
  auto status = PathSafety::checkHoldingDir(holding);
  if (status != PathSafety::Status::Allowed)
    throw InvalidArgumentError(PathSafety::getStatusMessage(status, holding));
}

ConsolidationReport
Pipeline::consolidate(const DuplicateGroup &group,
                      const std::optional<std::string> &keeper) {
  checkHoldingDir();
  auto moves = planGroup(group, keeper);
  std::map<int, std::string> keepers;
  keepers[group.id] = keeper ? *keeper : selectKeeper(group);
  return run(std::move(moves), std::move(keepers));
}

ConsolidationReport
Pipeline::consolidateFiles(const DuplicateGroup &group,
                           const std::vector<std::string> &files) {
  checkHoldingDir();
  auto moves = planFiles(group, files);
  std::map<int, std::string> keepers;
  for (const auto &file : group.files) {
    if (std::find(files.begin(), files.end(), file) == files.end()) {
      keepers[group.id] = file;
      break;
    }
  }
  return run(std::move(moves), std::move(keepers));
}

ConsolidationReport
Pipeline::consolidateAll(const std::map<int, std::string> &keeperOverrides) {
  checkHoldingDir();

  std::vector<MoveOperation> moves;
  std::map<int, std::string> keepers;

  for (const auto &group : groups()) {
    std::optional<std::string> keeper;
    auto it = keeperOverrides.find(group.id);
    if (it != keeperOverrides.end())
      keeper = it->second;

    auto planned = planGroup(group, keeper);
    keepers[group.id] = keeper ? *keeper : selectKeeper(group);
    moves.insert(moves.end(), std::make_move_iterator(planned.begin()),
                 std::make_move_iterator(planned.end()));
  }

  return run(std::move(moves), std::move(keepers));
}

ConsolidationReport Pipeline::run(std::vector<MoveOperation> moves,
                                  std::map<int, std::string> keepers) {
  ConsolidationReport report;
  report.keepers = std::move(keepers);
  report.dryRun = m_config.move.dryRun;

  for (const auto &move : moves) {
    const FileRecord *record = findRecord(move.source.string());
    if (record)
      report.bytes += record->getFileSize();
  }

  if (m_config.move.dryRun) {
    for (const auto &move : moves) {
      m_logger.info("Would move " + move.source.string() + " to " +
                        move.destination.string(),
                    {{"operation", "move"},
                     {"source", move.source.string()},
                     {"destination", move.destination.string()},
                     {"group_id", std::to_string(move.groupId)},
                     {"status", "planned"}});
    }
  } else {
    MoveTransaction transaction(m_fs, m_logger);
    transaction.execute(moves);
  }

  // Planned files leave the graph in a dry run too
  std::vector<std::string> moved;
  for (const auto &move : moves)
    moved.push_back(move.source.string());
  forget(moved);

  report.moves = std::move(moves);
  return report;
}

void Pipeline::forget(const std::vector<std::string> &paths) {
  if (paths.empty())
    return;
  m_graph.remove(paths);
  for (const auto &path : paths)
    m_records.erase(path);
}

std::vector<std::string>
Pipeline::deleteFiles(const std::vector<std::string> &files) {
  const bool dryRun = m_config.move.dryRun;
  std::vector<std::string> deleted;

  try {
    for (const auto &file : files) {
      auto status = PathSafety::checkDeletion(file);
      if (status != PathSafety::Status::Allowed)
        throw FileOperationError(PathSafety::getStatusMessage(status, file),
                                 file, "delete");

      if (!dryRun)
        m_fs.remove(file);

      m_logger.info((dryRun ? "Would delete " : "Deleted ") + file,
                    {{"operation", "delete"},
                     {"source", file},
                     {"status", dryRun ? "planned" : "deleted"}});
      deleted.push_back(file);
    }
  } catch (const FileOperationError &e) {
    m_logger.error("Delete failed", {{"operation", "delete"},
                                     {"source", e.getPath()},
                                     {"status", "failed"},
                                     {"error", e.what()}});
    forget(deleted);
    throw;
  }

  forget(deleted);
  return deleted;
}
