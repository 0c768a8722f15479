#include "symlinkresolver.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

SymlinkResolver::Result failure(SymlinkResolver::Status status, int hops) {
  return SymlinkResolver::Result{status, fs::path(), hops};
}

} // namespace

SymlinkResolver::SymlinkResolver(ResolverConfig config, Logger &logger)
    : m_config(std::move(config)), m_logger(logger) {
  m_config.validate();

  if (m_config.boundary) {
    std::error_code ec;
    fs::path boundary = fs::absolute(*m_config.boundary, ec);
    if (ec)
      throw InvalidArgumentError("invalid symlink boundary: " + ec.message());
    m_boundary = boundary.lexically_normal();
  }
}

SymlinkResolver::Result
SymlinkResolver::resolveDetailed(const fs::path &path) const {
  std::error_code ec;
  fs::path current = fs::absolute(path, ec);
  if (ec)
    return failure(Status::NotFound, 0);
  current = current.lexically_normal();

  fs::file_status st = fs::symlink_status(current, ec);
  if (ec || !fs::exists(st))
    return failure(Status::NotFound, 0);

  if (!fs::is_symlink(st))
    return Result{Status::Resolved, current, 0};

  if (!m_config.followSymlinks)
    return failure(Status::Disabled, 0);

  std::set<fs::path> visited{current};
  int hops = 0;

  while (fs::is_symlink(st)) {
    if (hops >= m_config.maxDepth)
      return failure(Status::DepthExceeded, hops);

    fs::path target = fs::read_symlink(current, ec);
    if (ec)
      return failure(Status::NotFound, hops);

    if (target.is_relative())
      target = current.parent_path() / target;
    target = target.lexically_normal();
    ++hops;

    if (m_boundary && !isWithin(target, *m_boundary))
      return failure(Status::ContainmentViolation, hops);

    if (!visited.insert(target).second)
      return failure(Status::CircularReference, hops);

    st = fs::symlink_status(target, ec);
    if (ec || !fs::exists(st))
      return failure(Status::NotFound, hops);

    current = std::move(target);
  }

  return Result{Status::Resolved, current, hops};
}

std::optional<fs::path> SymlinkResolver::resolve(const fs::path &path) const {
  Result result = resolveDetailed(path);
  if (result.status == Status::Resolved)
    return result.target;

  m_logger.debug("Symlink not resolved", {{"path", path.string()},
                                          {"reason", statusName(result.status)},
                                          {"hops", std::to_string(result.hops)}});
  return std::nullopt;
}

const char *SymlinkResolver::statusName(Status status) {
  switch (status) {
  case Status::Resolved:
    return "resolved";
  case Status::NotFound:
    return "not_found";
  case Status::CircularReference:
    return "circular_reference";
  case Status::DepthExceeded:
    return "depth_exceeded";
  case Status::ContainmentViolation:
    return "containment_violation";
  case Status::Disabled:
    return "disabled";
  }
  return "unknown";
}
