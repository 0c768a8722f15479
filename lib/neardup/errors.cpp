#include "errors.hpp"
#include "utils.hpp"

InvalidStrategyError::InvalidStrategyError(const std::string &name)
    : InvalidArgumentError(
          "Invalid retention strategy '" + name +
          "'. Must be one of: largest, newest, oldest, "
          "shortest-relative-path, smallest"),
      m_name(name) {}

FileOperationError::FileOperationError(const std::string &reason,
                                       const std::string &path,
                                       const std::string &operation)
    : NearDupError(operation + " failed for " + path + ": " + reason),
      m_path(path), m_operation(operation) {}

InsufficientSpaceError::InsufficientSpaceError(const std::string &path,
                                               std::uintmax_t required,
                                               std::uintmax_t available)
    : FileOperationError("Need " + formatBytes(required) + " (" +
                             std::to_string(required) + " bytes), but only " +
                             formatBytes(available) + " (" +
                             std::to_string(available) + " bytes) available",
                         path, "write"),
      m_required(required), m_available(available) {}
