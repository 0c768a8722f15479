#include "filerecord.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <sys/stat.h>

namespace {

FileRecord::Clock::time_point toTimePoint(const struct timespec &ts) {
  auto tp = FileRecord::Clock::from_time_t(ts.tv_sec);
  return tp + std::chrono::duration_cast<FileRecord::Clock::duration>(
                  std::chrono::nanoseconds(ts.tv_nsec));
}

} // namespace

FileRecord FileRecord::fromPath(const std::filesystem::path &path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec)
    throw FileOperationError(ec.message(), path.string(), "stat");
  absolute = absolute.lexically_normal();

  struct stat st;
  if (::stat(absolute.c_str(), &st) != 0) {
    int err = errno;
    if (err == EACCES)
      throw PermissionDeniedError(absolute.string(), "stat");
    throw FileOperationError(std::strerror(err), absolute.string(), "stat");
  }

  return FileRecord(absolute.string(), static_cast<std::uintmax_t>(st.st_size),
                    toTimePoint(st.st_mtim), toTimePoint(st.st_ctim));
}
