#ifndef SIGNATURECACHE_HPP
#define SIGNATURECACHE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

#include "signature.hpp"

/**
 * @class SignatureCache
 * @brief Signatures keyed by absolute path
 *
 * Owned by the caller and lent to the SimilarityGraph. Entries live until
 * they are invalidated explicitly; nothing is evicted behind the caller's
 * back. Not thread-safe.
 */
class SignatureCache {
public:
  /** @brief Cached signature for path, if any */
  std::optional<Signature> get(const std::string &path) const;

  bool contains(const std::string &path) const {
    return m_entries.count(path) > 0;
  }

  /** @brief Stores (or replaces) the signature for path */
  void put(const std::string &path, Signature signature);

  /** @brief Drops the entry for path; returns true if one existed */
  bool invalidate(const std::string &path);

  void clear() { m_entries.clear(); }
  std::size_t size() const { return m_entries.size(); }

private:
  std::unordered_map<std::string, Signature> m_entries;
};

#endif // SIGNATURECACHE_HPP
