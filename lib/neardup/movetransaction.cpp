#include "movetransaction.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <exception>
#include <map>
#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace {

fs::path withSuffix(const fs::path &dest, int counter) {
  return dest.parent_path() / (dest.stem().string() + "_" +
                               std::to_string(counter) +
                               dest.extension().string());
}

} // namespace

MovePlanner::MovePlanner(MoveConfig config) : m_config(std::move(config)) {
  m_config.validate();
}

fs::path MovePlanner::commonParent(const std::vector<std::string> &files) {
  if (files.empty())
    return fs::path();

  fs::path common = fs::path(files.front()).lexically_normal().parent_path();
  for (std::size_t i = 1; i < files.size(); ++i) {
    const fs::path parent = fs::path(files[i]).lexically_normal().parent_path();

    fs::path prefix;
    auto a = common.begin();
    auto b = parent.begin();
    for (; a != common.end() && b != parent.end() && *a == *b; ++a, ++b)
      prefix /= *a;
    common = prefix;
  }
  return common;
}

std::vector<MoveOperation>
MovePlanner::plan(const std::vector<std::string> &files,
                  const std::optional<std::string> &keeper, int groupId,
                  const std::optional<fs::path> &holdingDir) const {
  const fs::path holding = holdingDir ? *holdingDir : m_config.holdingDir;

  std::optional<fs::path> base = m_config.baseDir;
  if (m_config.preserveStructure && !base)
    base = commonParent(files);

  std::vector<MoveOperation> moves;
  std::set<fs::path> used;

  for (const auto &file : files) {
    if (keeper && file == *keeper)
      continue;

    const fs::path source(file);
    fs::path dest;
    if (m_config.preserveStructure && base && !base->empty() &&
        isWithin(source, *base)) {
      dest = holding / source.lexically_normal().lexically_relative(
                           base->lexically_normal());
    } else {
      dest = holding / source.filename();
    }

    const fs::path wanted = dest;
    for (int counter = 1; used.count(dest); ++counter)
      dest = withSuffix(wanted, counter);
    used.insert(dest);

    MoveOperation move;
    move.source = source;
    move.destination = dest;
    move.groupId = groupId;
    moves.push_back(std::move(move));
  }

  return moves;
}

MoveTransaction::MoveTransaction(IFileSystem &fileSystem, Logger &logger)
    : m_fs(fileSystem), m_logger(logger) {}

void MoveTransaction::preflight(const std::vector<MoveOperation> &moves) const {
  std::map<fs::path, std::uintmax_t> required;
  for (const auto &move : moves)
    required[move.destination.parent_path()] += m_fs.fileSize(move.source);

  for (const auto &entry : required) {
    const std::uintmax_t available = m_fs.availableSpace(entry.first);
    if (available < entry.second)
      throw InsufficientSpaceError(entry.first.string(), entry.second,
                                   available);
  }
}

void MoveTransaction::execute(std::vector<MoveOperation> &moves) {
  m_rollbackFailures = 0;
  if (moves.empty())
    return;

  preflight(moves);

  std::vector<MoveOperation *> completed;
  try {
    for (auto &move : moves) {
      m_fs.createDirectories(move.destination.parent_path());
      m_fs.move(move.source, move.destination);
      move.executed = true;
      completed.push_back(&move);
      logMove(move, "move", "moved");
    }
  } catch (const std::exception &e) {
    m_logger.error("Move failed, rolling back",
                   {{"error", e.what()},
                    {"completed", std::to_string(completed.size())}});
    rollback(completed);
    throw;
  }
}

void MoveTransaction::rollback(const std::vector<MoveOperation *> &completed) {
  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    MoveOperation &move = **it;
    try {
      m_fs.move(move.destination, move.source);
      move.executed = false;
      logMove(move, "rollback", "rolled_back");
    } catch (const std::exception &e) {
      ++m_rollbackFailures;
      m_logger.error("Rollback failed",
                     {{"operation", "rollback"},
                      {"source", move.destination.string()},
                      {"destination", move.source.string()},
                      {"group_id", std::to_string(move.groupId)},
                      {"status", "failed"},
                      {"error", e.what()}});
    }
  }
}

void MoveTransaction::logMove(const MoveOperation &move,
                              const std::string &operation,
                              const std::string &status) {
  const std::string message =
      operation == "rollback"
          ? "Restored " + move.source.string()
          : "Moved " + move.source.string() + " to " +
                move.destination.string();
  m_logger.info(message,
                {{"operation", operation},
                 {"source", move.source.string()},
                 {"destination", move.destination.string()},
                 {"group_id", std::to_string(move.groupId)},
                 {"status", status}});
}
