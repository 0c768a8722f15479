#include "signaturecache.hpp"

#include <utility>

std::optional<Signature> SignatureCache::get(const std::string &path) const {
  auto it = m_entries.find(path);
  if (it == m_entries.end())
    return std::nullopt;
  return it->second;
}

void SignatureCache::put(const std::string &path, Signature signature) {
  m_entries[path] = std::move(signature);
}

bool SignatureCache::invalidate(const std::string &path) {
  return m_entries.erase(path) > 0;
}
