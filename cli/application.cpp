#include "application.hpp"
#include "errors.hpp"
#include "pathsafety.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace {

std::string needValue(int argc, char *argv[], int &i) {
  if (i + 1 >= argc)
    throw InvalidArgumentError(std::string("missing value for ") + argv[i]);
  return argv[++i];
}

double parseDouble(const std::string &flag, const std::string &value) {
  try {
    std::size_t used = 0;
    double result = std::stod(value, &used);
    if (used == value.size())
      return result;
  } catch (const std::logic_error &) {
    // reported below
  }
  throw InvalidArgumentError("invalid number for " + flag + ": " + value);
}

std::size_t parseCount(const std::string &flag, const std::string &value) {
  if (value.empty() || value.front() == '-')
    throw InvalidArgumentError("invalid count for " + flag + ": " + value);
  try {
    std::size_t used = 0;
    unsigned long long result = std::stoull(value, &used);
    if (used == value.size())
      return static_cast<std::size_t>(result);
  } catch (const std::logic_error &) {
    // reported below
  }
  throw InvalidArgumentError("invalid count for " + flag + ": " + value);
}

std::string readHead(const std::string &path, std::size_t limit) {
  std::ifstream file(path, std::ios::binary);
  if (!file)
    throw FileOperationError("cannot open file", path, "preview");

  std::string content(limit, '\0');
  file.read(&content[0], static_cast<std::streamsize>(limit));
  if (file.bad())
    throw FileOperationError("read error", path, "preview");
  content.resize(static_cast<std::size_t>(file.gcount()));
  return content;
}

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::string Application::usage(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options] PATH...\n"
      << "\n"
      << "Detect and manage near-duplicate text files.\n"
      << "\n"
      << "Options:\n"
      << "  --mode interactive|non-interactive   (default: interactive)\n"
      << "  --threshold X            similarity threshold (default: 0.85)\n"
      << "  --exact-weights          measure every pair instead of group "
         "representatives\n"
      << "  --min-printable-ratio X  text detection ratio (default: 0.8)\n"
      << "  --num-perm N             MinHash permutations (default: 128)\n"
      << "  --shingle-size N         shingle width in bytes (default: 5)\n"
      << "  --chunk-size N           parallel chunk size (default: 1048576)\n"
      << "  --max-workers N          worker threads (default: CPU cores)\n"
      << "  --holding-dir DIR        where duplicates go (default: holding)\n"
      << "  --flat-holding           do not preserve directory structure\n"
      << "  --dry-run                show what would be done\n"
      << "  --retention STRATEGY     newest, oldest, shortest-relative-path,\n"
      << "                           largest, smallest (default: newest)\n"
      << "  --priority-paths P...    glob patterns of files to prefer\n"
      << "  --priority-first         apply priority patterns first\n"
      << "  --follow-symlinks        follow symlinks (default)\n"
      << "  --no-follow-symlinks     skip symlinks\n"
      << "  --max-symlink-depth N    longest symlink chain (default: 10)\n"
      << "  --symlink-boundary DIR   symlink targets must stay inside DIR\n"
      << "  --include-empty          also consider empty files\n"
      << "  --preview-chars N        preview width (default: 100)\n"
      << "  --preview-lines N        preview lines (default: 3)\n"
      << "  --log-file FILE          structured log file\n"
      << "  -v, --verbose            debug output\n"
      << "  -h, --help               this help\n";
  return out.str();
}

CliOptions Application::parseArguments(int argc, char *argv[]) {
  CliOptions options;
  std::string retention = "newest";
  std::vector<std::string> priorityPatterns;
  bool priorityFirst = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg == "--mode") {
      const std::string mode = needValue(argc, argv, i);
      if (mode == "interactive")
        options.interactive = true;
      else if (mode == "non-interactive")
        options.interactive = false;
      else
        throw InvalidArgumentError("invalid mode: " + mode);
    } else if (arg == "--threshold") {
      options.config.graph.threshold =
          parseDouble(arg, needValue(argc, argv, i));
    } else if (arg == "--exact-weights") {
      options.config.graph.propagation = EdgePropagation::Exact;
    } else if (arg == "--min-printable-ratio") {
      options.config.scan.minPrintableRatio =
          parseDouble(arg, needValue(argc, argv, i));
    } else if (arg == "--num-perm") {
      options.config.signature.numPerm =
          parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--shingle-size") {
      options.config.signature.shingleSize =
          parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--chunk-size") {
      options.config.signature.chunkSize =
          parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--max-workers") {
      options.config.signature.workers =
          parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--holding-dir") {
      options.config.move.holdingDir = needValue(argc, argv, i);
    } else if (arg == "--flat-holding") {
      options.config.move.preserveStructure = false;
    } else if (arg == "--dry-run") {
      options.config.move.dryRun = true;
    } else if (arg == "--retention") {
      retention = needValue(argc, argv, i);
    } else if (arg == "--priority-paths") {
      // takes every following value up to the next flag
      while (i + 1 < argc && argv[i + 1][0] != '-')
        priorityPatterns.emplace_back(argv[++i]);
      if (priorityPatterns.empty())
        throw InvalidArgumentError("missing value for --priority-paths");
    } else if (arg == "--priority-first") {
      priorityFirst = true;
    } else if (arg == "--follow-symlinks") {
      options.config.scan.resolver.followSymlinks = true;
    } else if (arg == "--no-follow-symlinks") {
      options.config.scan.resolver.followSymlinks = false;
    } else if (arg == "--max-symlink-depth") {
      options.config.scan.resolver.maxDepth =
          static_cast<int>(parseCount(arg, needValue(argc, argv, i)));
    } else if (arg == "--symlink-boundary") {
      options.config.scan.resolver.boundary =
          std::filesystem::path(needValue(argc, argv, i));
    } else if (arg == "--include-empty") {
      options.config.scan.skipEmpty = false;
    } else if (arg == "--preview-chars") {
      options.preview.maxChars = parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--preview-lines") {
      options.preview.maxLines = parseCount(arg, needValue(argc, argv, i));
    } else if (arg == "--log-file") {
      options.logFile = std::filesystem::path(needValue(argc, argv, i));
    } else if (!arg.empty() && arg[0] == '-') {
      throw InvalidArgumentError("unknown option: " + arg);
    } else {
      options.paths.emplace_back(arg);
    }
  }

  options.config.retention =
      RetentionConfig::create(retention, priorityPatterns, priorityFirst);

  if (options.help)
    return options;

  if (options.paths.empty())
    throw InvalidArgumentError("at least one path is required");

  options.config.validate();
  options.preview.validate();
  return options;
}

int Application::run(const CliOptions &options,
                     const std::atomic<bool> *cancel) {
  m_cancel = cancel;
  m_logger.setVerbose(options.verbose);
  if (options.logFile && !m_logger.openFile(*options.logFile)) {
    m_logger.warning("Cannot open log file " + options.logFile->string());
  }

  try {
    Pipeline pipeline(options.config, m_fs, m_logger);
    pipeline.setCancelFlag(cancel);

    m_logger.info("Starting file scan", {{"operation", "scan"},
                                         {"paths", std::to_string(
                                                       options.paths.size())}});
    m_out << "Scanning..." << std::endl;
    const std::size_t found = pipeline.scan(options.paths);

    if (pipeline.isCancelled()) {
      m_out << "Cancelled." << std::endl;
      return EXIT_CANCELLED;
    }
    if (found == 0) {
      m_out << "No valid text files found." << std::endl;
      return EXIT_OK;
    }
    m_out << found << " text files signed." << std::endl;

    return options.interactive ? runInteractive(pipeline, options)
                               : runNonInteractive(pipeline, options);
  } catch (const NearDupError &e) {
    m_logger.error(e.what());
    return EXIT_ABORT;
  } catch (const std::invalid_argument &e) {
    m_logger.error(e.what());
    return EXIT_ABORT;
  }
}

int Application::runNonInteractive(Pipeline &pipeline,
                                   const CliOptions &options) {
  auto groups = pipeline.groups();
  if (groups.empty()) {
    m_out << "No similar files found" << std::endl;
    return EXIT_OK;
  }

  for (const auto &group : groups) {
    m_view.showGroup(group, pipeline.recordsFor(group.files),
                     pipeline.selectKeeper(group));
  }

  try {
    ConsolidationReport report = pipeline.consolidateAll();
    m_view.showMovePlan(report.moves, report.dryRun);
    m_out << "Total: " << report.moves.size() << " files ("
          << formatBytes(report.bytes) << ") in " << groups.size()
          << " groups" << std::endl;
    if (!report.dryRun)
      m_out << "Successfully moved all files" << std::endl;
  } catch (const FileOperationError &e) {
    m_logger.error("Failed to move files: " + std::string(e.what()),
                   {{"operation", e.getOperation()}, {"path", e.getPath()}});
    return EXIT_ABORT;
  }

  if (options.logFile)
    m_logger.info("Operation complete. Full details in: " +
                  options.logFile->string());
  return EXIT_OK;
}

int Application::runInteractive(Pipeline &pipeline,
                                const CliOptions &options) {
  std::set<int> skipped;
  std::vector<MoveOperation> pending;
  std::size_t deletedTotal = 0;

  bool quit = false;

  while (!quit) {
    if (m_cancel && m_cancel->load())
      return EXIT_CANCELLED;

    auto groups = pipeline.groups();
    auto it = std::find_if(groups.begin(), groups.end(),
                           [&skipped](const DuplicateGroup &g) {
                             return skipped.count(g.id) == 0;
                           });
    if (it == groups.end())
      break;
    const DuplicateGroup group = *it;

    std::optional<std::string> keeperOverride;
    bool nextGroup = false;

    while (!nextGroup) {
      const std::string keeper =
          keeperOverride ? *keeperOverride : pipeline.selectKeeper(group);
      m_view.showGroup(group, pipeline.recordsFor(group.files), keeper);

      auto answer = prompt("[k]eep all  [m]ove  [d]elete  [s]imilarities  "
                           "[p]review  [n]ext  [q]uit  or 1-" +
                           std::to_string(group.files.size()) +
                           " to choose the keeper: ");
      if (!answer) {
        if (m_cancel && m_cancel->load())
          return EXIT_CANCELLED;
        return EXIT_OK;
      }
      const std::string action = trim(*answer);

      if (action == "q") {
        quit = true;
        nextGroup = true;
      } else if (action == "n") {
        skipped.insert(group.id);
        nextGroup = true;
      } else if (action == "k") {
        pipeline.graph().dissolve(group.files);
        m_logger.info("Kept all files of group",
                      {{"operation", "keep"},
                       {"group_id", std::to_string(group.id)}});
        nextGroup = true;
      } else if (action == "s") {
        m_view.showSimilarities(pipeline.graph().pairSimilarities(group.files));
      } else if (action == "p") {
        showPreview(group.files, options.preview);
      } else if (action == "m") {
        auto selected = selectFiles(group, keeper, "move");
        if (!selected)
          return EXIT_OK;
        if (selected->empty())
          continue;
        try {
          auto plan = pipeline.planFiles(group, *selected);
          m_view.showMovePlan(plan, options.config.move.dryRun);
          if (!confirm("Move " + std::to_string(plan.size()) + " files?"))
            continue;
          ConsolidationReport report =
              pipeline.consolidateFiles(group, *selected);
          pending.insert(pending.end(), report.moves.begin(),
                         report.moves.end());
          nextGroup = true;
        } catch (const FileOperationError &e) {
          m_logger.error("Move aborted: " + std::string(e.what()),
                         {{"group_id", std::to_string(group.id)}});
          skipped.insert(group.id);
          nextGroup = true;
        } catch (const std::invalid_argument &e) {
          m_logger.error(e.what());
          return EXIT_ABORT;
        }
      } else if (action == "d") {
        auto selected = selectFiles(group, keeper, "delete");
        if (!selected)
          return EXIT_OK;
        if (selected->empty())
          continue;
        for (const auto &file : *selected)
          m_out << "  " << file << "\n";
        if (!confirm("Delete " + std::to_string(selected->size()) + " files?"))
          continue;
        try {
          deletedTotal += pipeline.deleteFiles(*selected).size();
        } catch (const FileOperationError &e) {
          m_logger.error("Delete aborted: " + std::string(e.what()),
                         {{"group_id", std::to_string(group.id)}});
          skipped.insert(group.id);
        }
        nextGroup = true;
      } else {
        const int choice = std::atoi(action.c_str());
        const std::string *chosen = safe_at(group.files, choice - 1);
        if (chosen)
          keeperOverride = *chosen;
        else
          m_out << "Unknown action: " << action << std::endl;
      }
    }
  }

  const bool dryRun = options.config.move.dryRun;
  if (!quit)
    m_out << "No more duplicate groups found." << std::endl;
  if (!pending.empty())
    m_out << (dryRun ? "Would move " : "Moved ") << pending.size()
          << " files to " << options.config.move.holdingDir.string()
          << std::endl;
  if (deletedTotal > 0)
    m_out << (dryRun ? "Would delete " : "Deleted ") << deletedTotal
          << " files" << std::endl;

  cleanup(pending, options);
  return EXIT_OK;
}

void Application::cleanup(const std::vector<MoveOperation> &pending,
                          const CliOptions &options) {
  if (pending.empty()) {
    m_logger.debug("No pending moves to clean up");
    return;
  }

  std::map<std::filesystem::path, std::vector<const MoveOperation *>> byDest;
  for (const auto &move : pending)
    byDest[move.destination.parent_path()].push_back(&move);

  m_logger.info("Cleaning up " + std::to_string(pending.size()) +
                    " moves across " + std::to_string(byDest.size()) +
                    " directories",
                {{"operation", "cleanup"}});

  const bool dryRun = options.config.move.dryRun;
  m_out << "\nCleanup\n"
        << (dryRun ? "Would move " : "Moved ") << pending.size()
        << " files to " << byDest.size() << " directories:\n";
  for (const auto &[dir, moves] : byDest) {
    m_out << "\n" << dir.string() << ":\n";
    for (const MoveOperation *move : moves)
      m_out << "  " << move->source.filename().string() << "\n";
  }
  m_out << std::flush;

  if (dryRun) {
    m_out << "\nDRY RUN - No files were actually moved" << std::endl;
    return;
  }

  const std::filesystem::path &holding = options.config.move.holdingDir;
  if (!confirm("Delete holding directory " + holding.string() + "?"))
    return;

  auto status = PathSafety::checkDeletion(holding.string());
  if (status != PathSafety::Status::Allowed) {
    m_logger.error("Failed to delete holding directory: " +
                   PathSafety::getStatusMessage(status, holding.string()));
    return;
  }

  try {
    m_logger.info("Deleting holding directory: " + holding.string(),
                  {{"operation", "delete"}, {"source", holding.string()}});
    m_fs.removeAll(holding);
    m_out << "Deleted holding directory" << std::endl;
  } catch (const FileOperationError &e) {
    m_logger.error("Failed to delete holding directory: " +
                       std::string(e.what()),
                   {{"operation", "delete"}, {"source", e.getPath()}});
  }
}

std::optional<std::string> Application::prompt(const std::string &question) {
  m_out << question << std::flush;
  std::string line;
  if (!std::getline(m_in, line))
    return std::nullopt;
  return line;
}

std::optional<std::vector<std::string>>
Application::selectFiles(const DuplicateGroup &group, const std::string &keeper,
                         const std::string &verb) {
  auto answer = prompt("Files to " + verb +
                       " (numbers, 'all', 'none', Enter for all but the "
                       "keeper): ");
  if (!answer)
    return std::nullopt;

  const std::string input = trim(*answer);
  std::vector<std::string> selected;

  if (input.empty()) {
    for (const auto &file : group.files) {
      if (file != keeper)
        selected.push_back(file);
    }
    return selected;
  }
  if (input == "none")
    return selected;
  if (input == "all")
    return group.files;

  std::istringstream tokens(input);
  std::string token;
  while (tokens >> token) {
    const std::string *file = nullptr;
    if (std::all_of(token.begin(), token.end(),
                    [](unsigned char c) { return std::isdigit(c); }))
      file = safe_at(group.files, std::atoi(token.c_str()) - 1);
    if (!file) {
      m_out << "Invalid selection: " << token << std::endl;
      return std::vector<std::string>();
    }
    if (std::find(selected.begin(), selected.end(), *file) == selected.end())
      selected.push_back(*file);
  }
  return selected;
}

bool Application::confirm(const std::string &question) {
  auto answer = prompt(question + " [y/N] ");
  if (!answer)
    return false;
  const std::string a = trim(*answer);
  return a == "y" || a == "Y" || a == "yes";
}

void Application::showPreview(const std::vector<std::string> &files,
                              const PreviewConfig &preview) {
  // enough bytes for every shown line to hit its cut
  const std::size_t limit = (preview.maxChars + 1) * (preview.maxLines + 1);

  for (const auto &file : files) {
    try {
      std::string head = readHead(file, limit);
      m_view.showPreview(file,
                         formatPreview(head, preview.maxLines,
                                       preview.maxChars,
                                       preview.truncationMarker));
    } catch (const FileOperationError &e) {
      m_logger.warning(e.what(), {{"path", file}});
    }
  }
}
