#include "config.hpp"
#include "errors.hpp"

#include <thread>
#include <utility>

void ResolverConfig::validate() const {
  if (maxDepth <= 0)
    throw InvalidArgumentError("max symlink depth must be positive");
  if (boundary && boundary->empty())
    throw InvalidArgumentError("symlink boundary must not be empty");
}

void SignatureConfig::validate() const {
  if (shingleSize == 0)
    throw InvalidArgumentError("shingle size must be positive");
  if (numPerm == 0)
    throw InvalidArgumentError("number of permutations must be positive");
  if (chunkSize == 0)
    throw InvalidArgumentError("chunk size must be positive");
  // a chunk must at least hold one boundary window
  if (chunkSize < shingleSize)
    throw InvalidArgumentError("chunk size must not be smaller than the "
                               "shingle size");
}

std::size_t SignatureConfig::effectiveWorkers() const {
  if (workers > 0)
    return workers;
  unsigned int hw = std::thread::hardware_concurrency();
  return hw > 0 ? hw : 1;
}

void GraphConfig::validate() const {
  if (!(threshold > 0.0 && threshold <= 1.0))
    throw InvalidArgumentError("threshold must be in (0, 1]");
}

RetentionConfig::RetentionConfig(RetentionStrategy strategy,
                                 std::vector<std::string> priorityPatterns,
                                 bool priorityFirst)
    : m_strategy(strategy), m_priorityPatterns(std::move(priorityPatterns)),
      m_priorityFirst(priorityFirst) {
  for (const auto &pattern : m_priorityPatterns) {
    if (pattern.empty())
      throw InvalidArgumentError("priority pattern must not be empty");
  }
}

RetentionConfig RetentionConfig::create(const std::string &strategy,
                                        std::vector<std::string> priorityPatterns,
                                        bool priorityFirst) {
  return RetentionConfig(parseStrategy(strategy), std::move(priorityPatterns),
                         priorityFirst);
}

RetentionStrategy RetentionConfig::parseStrategy(const std::string &name) {
  if (name == "newest")
    return RetentionStrategy::Newest;
  if (name == "oldest")
    return RetentionStrategy::Oldest;
  if (name == "shortest-relative-path" || name == "shortest_path")
    return RetentionStrategy::ShortestRelativePath;
  if (name == "largest")
    return RetentionStrategy::Largest;
  if (name == "smallest")
    return RetentionStrategy::Smallest;
  throw InvalidStrategyError(name);
}

std::string RetentionConfig::strategyName(RetentionStrategy strategy) {
  switch (strategy) {
  case RetentionStrategy::Newest:
    return "newest";
  case RetentionStrategy::Oldest:
    return "oldest";
  case RetentionStrategy::ShortestRelativePath:
    return "shortest-relative-path";
  case RetentionStrategy::Largest:
    return "largest";
  case RetentionStrategy::Smallest:
    return "smallest";
  }
  return "unknown";
}

void MoveConfig::validate() const {
  if (holdingDir.empty())
    throw InvalidArgumentError("holding directory must not be empty");
  if (baseDir && baseDir->empty())
    throw InvalidArgumentError("base directory must not be empty");
}

void ScanConfig::validate() const {
  if (!(minPrintableRatio > 0.0 && minPrintableRatio <= 1.0))
    throw InvalidArgumentError("min printable ratio must be in (0, 1]");
  resolver.validate();
}

void PreviewConfig::validate() const {
  if (maxChars == 0)
    throw InvalidArgumentError("max preview chars must be positive");
  if (maxLines == 0)
    throw InvalidArgumentError("max preview lines must be positive");
}

void PipelineConfig::validate() const {
  scan.validate();
  signature.validate();
  graph.validate();
  move.validate();
}
