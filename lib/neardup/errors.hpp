/**
 * @file errors.hpp
 * @brief Exception hierarchy for neardup
 *
 * Per-file problems (unresolvable symlinks, unreadable files) are reported as
 * empty results and never reach these types. Exceptions are reserved for
 * invalid configuration and for batch-fatal filesystem operations.
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Base class of every neardup exception
 */
class NearDupError : public std::runtime_error {
public:
  explicit NearDupError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Malformed configuration or an empty required argument
 *
 * Derives from std::invalid_argument so callers that only know the standard
 * hierarchy still catch it.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
  explicit InvalidArgumentError(const std::string &message)
      : std::invalid_argument(message) {}
};

/**
 * @brief Unknown retention strategy name
 */
class InvalidStrategyError : public InvalidArgumentError {
public:
  explicit InvalidStrategyError(const std::string &name);

  const std::string &getName() const { return m_name; }

private:
  std::string m_name;
};

/**
 * @brief A filesystem operation (read, move, delete, space check) failed
 *
 * The message has the form "<operation> failed for <path>: <reason>".
 */
class FileOperationError : public NearDupError {
public:
  FileOperationError(const std::string &reason, const std::string &path,
                     const std::string &operation);

  const std::string &getPath() const { return m_path; }
  const std::string &getOperation() const { return m_operation; }

private:
  std::string m_path;
  std::string m_operation;
};

/**
 * @brief Reading or decoding content for signing failed
 */
class SigningError : public FileOperationError {
public:
  SigningError(const std::string &reason, const std::string &path)
      : FileOperationError(reason, path, "sign") {}
};

/**
 * @brief The OS refused an operation for lack of permission
 */
class PermissionDeniedError : public FileOperationError {
public:
  PermissionDeniedError(const std::string &path, const std::string &operation)
      : FileOperationError("Permission denied", path, operation) {}
};

/**
 * @brief Preflight found less free space than a move batch needs
 */
class InsufficientSpaceError : public FileOperationError {
public:
  InsufficientSpaceError(const std::string &path, std::uintmax_t required,
                         std::uintmax_t available);

  std::uintmax_t getRequiredBytes() const { return m_required; }
  std::uintmax_t getAvailableBytes() const { return m_available; }

private:
  std::uintmax_t m_required;
  std::uintmax_t m_available;
};

#endif // ERRORS_HPP
