#include "similaritygraph.hpp"

#include <algorithm>
#include <set>
#include <utility>

SimilarityGraph::SimilarityGraph(SignatureCache &cache, GraphConfig config,
                                 Logger &logger)
    : m_cache(cache), m_config(std::move(config)), m_logger(logger) {
  m_config.validate();
}

std::size_t SimilarityGraph::add(const std::vector<FileRecord> &files) {
  if (files.empty())
    return 0;

  // Snapshot before inserting, so new files only meet the old graph here
  const auto existing = components();
  std::vector<std::string> existingNodes;
  if (m_config.propagation == EdgePropagation::Exact) {
    for (const auto &node : m_adjacency)
      existingNodes.push_back(node.first);
  }

  std::vector<std::string> added;
  for (const auto &file : files) {
    const std::string &path = file.getPath();
    if (m_adjacency.count(path))
      continue;

    m_adjacency.emplace(path, Neighbors());
    if (file.hasSignature())
      m_cache.put(path, *file.getSignature());
    added.push_back(path);
  }

  std::vector<std::pair<std::string, Signature>> signedFiles;
  for (const auto &path : added) {
    auto sig = m_cache.get(path);
    if (sig)
      signedFiles.emplace_back(path, std::move(*sig));
  }

  for (std::size_t i = 0; i < signedFiles.size(); ++i) {
    for (std::size_t j = i + 1; j < signedFiles.size(); ++j) {
      const double sim = similarity(signedFiles[i].second, signedFiles[j].second);
      if (sim >= m_config.threshold)
        addEdge(signedFiles[i].first, signedFiles[j].first, sim, false);
    }
  }

  for (const auto &entry : signedFiles) {
    if (m_config.propagation == EdgePropagation::Exact)
      connectExact(entry.first, entry.second, existingNodes);
    else
      connectRepresentative(entry.first, entry.second, existing);
  }

  m_logger.debug("Added files to similarity graph",
                 {{"added", std::to_string(added.size())},
                  {"signed", std::to_string(signedFiles.size())},
                  {"nodes", std::to_string(m_adjacency.size())}});
  return added.size();
}

void SimilarityGraph::connectRepresentative(
    const std::string &path, const Signature &sig,
    const std::vector<std::vector<std::string>> &existing) {
  for (const auto &component : existing) {
    // members are sorted, so the first signed one is the smallest
    std::optional<Signature> repSig;
    auto rep = component.begin();
    for (; rep != component.end(); ++rep) {
      repSig = m_cache.get(*rep);
      if (repSig)
        break;
    }
    if (!repSig)
      continue;

    const double sim = similarity(sig, *repSig);
    if (sim < m_config.threshold)
      continue;

    addEdge(path, *rep, sim, false);
    for (const auto &member : component) {
      if (member != *rep && !hasEdge(path, member))
        addEdge(path, member, sim, true);
    }
  }
}

void SimilarityGraph::connectExact(const std::string &path,
                                   const Signature &sig,
                                   const std::vector<std::string> &existing) {
  for (const auto &node : existing) {
    auto other = m_cache.get(node);
    if (!other)
      continue;

    const double sim = similarity(sig, *other);
    if (sim >= m_config.threshold)
      addEdge(path, node, sim, false);
  }
}

void SimilarityGraph::addEdge(const std::string &a, const std::string &b,
                              double weight, bool inherited) {
  if (a == b)
    return;
  m_adjacency[a][b] = Edge{weight, inherited};
  m_adjacency[b][a] = Edge{weight, inherited};
}

bool SimilarityGraph::hasEdge(const std::string &a,
                              const std::string &b) const {
  auto it = m_adjacency.find(a);
  return it != m_adjacency.end() && it->second.count(b) > 0;
}

std::optional<double> SimilarityGraph::weight(const std::string &a,
                                              const std::string &b) const {
  auto it = m_adjacency.find(a);
  if (it == m_adjacency.end())
    return std::nullopt;
  auto edge = it->second.find(b);
  if (edge == it->second.end())
    return std::nullopt;
  return edge->second.weight;
}

std::size_t SimilarityGraph::edgeCount() const {
  std::size_t degrees = 0;
  for (const auto &node : m_adjacency)
    degrees += node.second.size();
  return degrees / 2;
}

std::vector<std::vector<std::string>> SimilarityGraph::components() const {
  std::vector<std::vector<std::string>> result;
  std::set<std::string> seen;

  // m_adjacency is ordered, so each component starts at its smallest member
  for (const auto &node : m_adjacency) {
    if (seen.count(node.first))
      continue;

    std::vector<std::string> component;
    std::vector<std::string> stack{node.first};
    seen.insert(node.first);

    while (!stack.empty()) {
      std::string current = std::move(stack.back());
      stack.pop_back();

      for (const auto &neighbor : m_adjacency.at(current)) {
        if (seen.insert(neighbor.first).second)
          stack.push_back(neighbor.first);
      }
      component.push_back(std::move(current));
    }

    std::sort(component.begin(), component.end());
    result.push_back(std::move(component));
  }

  return result;
}

std::vector<DuplicateGroup> SimilarityGraph::groups() {
  std::vector<DuplicateGroup> result;
  std::set<int> usedIds;
  std::map<std::string, int> memberIds;

  for (auto &component : components()) {
    if (component.size() < 2)
      continue;

    int id = 0;
    for (const auto &member : component) {
      auto it = m_memberIds.find(member);
      if (it != m_memberIds.end() && !usedIds.count(it->second) &&
          (id == 0 || it->second < id))
        id = it->second;
    }
    if (id == 0)
      id = m_nextGroupId++;
    usedIds.insert(id);

    double total = 0.0;
    std::size_t edges = 0;
    for (const auto &member : component) {
      for (const auto &neighbor : m_adjacency.at(member)) {
        if (member < neighbor.first) {
          total += neighbor.second.weight;
          ++edges;
        }
      }
      memberIds[member] = id;
    }

    const double mean = edges > 0 ? total / static_cast<double>(edges) : 0.0;
    result.push_back(DuplicateGroup{id, std::move(component), mean});
  }

  m_memberIds = std::move(memberIds);

  std::sort(result.begin(), result.end(),
            [](const DuplicateGroup &a, const DuplicateGroup &b) {
              if (a.similarity != b.similarity)
                return a.similarity > b.similarity;
              return a.id < b.id;
            });
  return result;
}

void SimilarityGraph::remove(const std::vector<std::string> &paths) {
  for (const auto &path : paths) {
    auto it = m_adjacency.find(path);
    if (it == m_adjacency.end())
      continue;

    for (const auto &neighbor : it->second)
      m_adjacency[neighbor.first].erase(path);
    m_adjacency.erase(it);

    m_cache.invalidate(path);
    m_memberIds.erase(path);
  }
}

void SimilarityGraph::dissolve(const std::vector<std::string> &paths) {
  for (const auto &a : paths) {
    auto it = m_adjacency.find(a);
    if (it == m_adjacency.end())
      continue;
    for (const auto &b : paths)
      it->second.erase(b);
  }
}

std::vector<PairSimilarity>
SimilarityGraph::pairSimilarities(const std::vector<std::string> &paths) const {
  std::vector<PairSimilarity> result;
  for (std::size_t i = 0; i < paths.size(); ++i) {
    auto it = m_adjacency.find(paths[i]);
    if (it == m_adjacency.end())
      continue;

    for (std::size_t j = i + 1; j < paths.size(); ++j) {
      auto edge = it->second.find(paths[j]);
      if (edge != it->second.end()) {
        result.push_back(PairSimilarity{paths[i], paths[j],
                                        edge->second.weight,
                                        edge->second.inherited});
      }
    }
  }
  return result;
}

void SimilarityGraph::clear() {
  for (const auto &node : m_adjacency)
    m_cache.invalidate(node.first);
  m_adjacency.clear();
  m_memberIds.clear();
}
