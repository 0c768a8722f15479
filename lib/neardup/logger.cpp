/**
 * @file logger.cpp
 * @brief Implementation of the structured logger
 */

#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace {

std::string timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

} // namespace

Logger &Logger::instance() {
  static Logger logger;
  return logger;
}

void Logger::setConsole(std::ostream *console) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_console = console;
}

void Logger::setVerbose(bool verbose) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_verbose = verbose;
}

bool Logger::openFile(const std::filesystem::path &path) {
  std::lock_guard<std::mutex> lock(m_mutex);

  if (m_file.is_open())
    m_file.close();

  std::error_code ec;
  if (path.has_parent_path())
    std::filesystem::create_directories(path.parent_path(), ec);
  if (ec)
    return false;

  m_file.open(path, std::ios::app);
  return m_file.is_open();
}

void Logger::closeFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_file.is_open())
    m_file.close();
}

const char *Logger::levelName(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  }
  return "UNKNOWN";
}

nlohmann::json Logger::formatRecord(Level level, const std::string &message,
                                    const Fields &fields) {
  nlohmann::json record = {{"level", levelName(level)},
                           {"logger", "neardup"},
                           {"message", message}};
  for (const auto &[key, value] : fields)
    record[key] = value;
  return record;
}

void Logger::log(Level level, const std::string &message,
                 const Fields &fields) {
  std::lock_guard<std::mutex> lock(m_mutex);

  if (m_file.is_open()) {
    auto record = formatRecord(level, message, fields);
    record["timestamp"] = timestamp();
    // paths are not guaranteed to be valid UTF-8
    m_file << record.dump(-1, ' ', false,
                          nlohmann::json::error_handler_t::replace)
           << '\n';
    m_file.flush();
  }

  if (!m_console)
    return;
  if (level == Level::Debug && !m_verbose)
    return;

  switch (level) {
  case Level::Warning:
    *m_console << "warning: ";
    break;
  case Level::Error:
    *m_console << "error: ";
    break;
  default:
    break;
  }
  *m_console << message;
  if (m_verbose) {
    for (const auto &[key, value] : fields)
      *m_console << ' ' << key << '=' << value;
  }
  *m_console << std::endl;
}
