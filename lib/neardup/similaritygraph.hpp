/**
 * @file similaritygraph.hpp
 * @brief Incremental similarity graph and duplicate-group extraction
 */

#ifndef SIMILARITYGRAPH_HPP
#define SIMILARITYGRAPH_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "filerecord.hpp"
#include "logger.hpp"
#include "signaturecache.hpp"

/**
 * @brief A connected component of at least two similar files
 */
struct DuplicateGroup {
  int id;

  /** @brief Member paths, strictly increasing */
  std::vector<std::string> files;

  /** @brief Mean weight of the edges inside the component */
  double similarity;
};

/**
 * @brief Weight of one edge, as shown in similarity tables
 */
struct PairSimilarity {
  std::string first;
  std::string second;
  double weight;

  /** @brief True if the weight was copied from a group representative */
  bool inherited;
};

/**
 * @class SimilarityGraph
 * @brief Undirected weighted graph over file paths
 *
 * Nodes are absolute paths. An edge joins two files whose estimated
 * similarity is at least the configured threshold; its weight is that
 * similarity. Files without a signature become isolated nodes.
 *
 * Signatures are read from a caller-owned SignatureCache. add() stores the
 * signatures of the records it receives there and remove() purges them.
 *
 * With EdgePropagation::Representative (the default) a new file is compared
 * against one representative per existing component, the lexically smallest
 * member that has a signature. On a match the representative gets a
 * measured edge and every other member of that component gets an edge that
 * inherits the same weight. Group means over such edges are therefore an
 * approximation. EdgePropagation::Exact measures every pair instead.
 */
class SimilarityGraph {
public:
  /**
   * @throws InvalidArgumentError if config is invalid
   */
  explicit SimilarityGraph(SignatureCache &cache, GraphConfig config = {},
                           Logger &logger = Logger::instance());

  const GraphConfig &getConfig() const { return m_config; }

  /**
   * @brief Inserts files and connects them to similar ones
   *
   * Paths already in the graph (or repeated in files) are ignored.
   *
   * @return the number of nodes actually added
   * @throws InvalidArgumentError if signatures of different sizes meet
   */
  std::size_t add(const std::vector<FileRecord> &files);

  /**
   * @brief Current duplicate groups
   *
   * Sorted by mean similarity (descending), then id. A group keeps its id
   * while it persists; when groups merge the older id survives, and when a
   * group splits the part with the smallest member keeps it.
   */
  std::vector<DuplicateGroup> groups();

  /**
   * @brief Deletes nodes with their edges and cached signatures
   *
   * Unknown paths are ignored.
   */
  void remove(const std::vector<std::string> &paths);

  /**
   * @brief Deletes the edges among the given paths, keeping the nodes
   */
  void dissolve(const std::vector<std::string> &paths);

  /**
   * @brief Edges among the given paths, in the order the paths are listed
   */
  std::vector<PairSimilarity>
  pairSimilarities(const std::vector<std::string> &paths) const;

  bool contains(const std::string &path) const {
    return m_adjacency.count(path) > 0;
  }

  /** @brief Weight of the edge between a and b, if there is one */
  std::optional<double> weight(const std::string &a,
                               const std::string &b) const;

  std::size_t nodeCount() const { return m_adjacency.size(); }
  std::size_t edgeCount() const;

  void clear();

private:
  struct Edge {
    double weight;
    bool inherited;
  };

  using Neighbors = std::map<std::string, Edge>;

  void addEdge(const std::string &a, const std::string &b, double weight,
               bool inherited);
  bool hasEdge(const std::string &a, const std::string &b) const;

  /** @brief Connected components, each sorted, ordered by smallest member */
  std::vector<std::vector<std::string>> components() const;

  void connectRepresentative(const std::string &path, const Signature &sig,
                             const std::vector<std::vector<std::string>> &existing);
  void connectExact(const std::string &path, const Signature &sig,
                    const std::vector<std::string> &existing);

  SignatureCache &m_cache;
  GraphConfig m_config;
  Logger &m_logger;

  std::map<std::string, Neighbors> m_adjacency;
  std::map<std::string, int> m_memberIds;
  int m_nextGroupId = 1;
};

#endif // SIMILARITYGRAPH_HPP
