/**
 * @file logger.hpp
 * @brief Leveled logger with structured fields
 *
 * Console output stays human-readable (message only); the optional log file
 * receives one JSON object per line:
 *
 * @code
 * {"destination":"/h/group_1/x.txt","group_id":"1","level":"INFO",
 *  "logger":"neardup","message":"Moved file","operation":"move",
 *  "source":"/a/x.txt","status":"moved","timestamp":"2026-10-19T14:03:11"}
 * @endcode
 *
 * (a single line in the actual file). Fields are added as top-level keys.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

class Logger {
public:
  enum class Level { Debug, Info, Warning, Error };

  /** @brief Ordered structured fields attached to a record */
  using Fields = std::vector<std::pair<std::string, std::string>>;

  /**
   * @brief Creates a logger writing info and above to the given stream
   *
   * @param console Console sink, or nullptr to disable console output
   */
  explicit Logger(std::ostream *console = &std::cerr) : m_console(console) {}

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /**
   * @brief Process-wide default logger used by the convenience overloads
   */
  static Logger &instance();

  void setConsole(std::ostream *console);

  /** @brief When set, debug records also reach the console */
  void setVerbose(bool verbose);

  /**
   * @brief Opens (appending) a structured log file
   *
   * Parent directories are created. Every record, debug included, is written
   * to the file regardless of the verbose flag.
   *
   * @return false if the file could not be opened; logging continues to the
   *         console only
   */
  bool openFile(const std::filesystem::path &path);
  void closeFile();

  void log(Level level, const std::string &message, const Fields &fields = {});

  void debug(const std::string &message, const Fields &fields = {}) {
    log(Level::Debug, message, fields);
  }
  void info(const std::string &message, const Fields &fields = {}) {
    log(Level::Info, message, fields);
  }
  void warning(const std::string &message, const Fields &fields = {}) {
    log(Level::Warning, message, fields);
  }
  void error(const std::string &message, const Fields &fields = {}) {
    log(Level::Error, message, fields);
  }

  /**
   * @brief Builds the JSON object written to the log file
   *
   * Exposed for tests; the timestamp is added by log() so the result is
   * stable.
   */
  static nlohmann::json formatRecord(Level level, const std::string &message,
                                     const Fields &fields);

  static const char *levelName(Level level);

private:
  std::mutex m_mutex;
  std::ostream *m_console;
  std::ofstream m_file;
  bool m_verbose = false;
};

#endif // LOGGER_HPP
