/**
 * @file signatureengine.cpp
 * @brief Implementation of shingling, MinHash folding and the chunked path
 */

#include "signatureengine.hpp"
#include "errors.hpp"
#include "fnv1a.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <fstream>
#include <random>
#include <system_error>
#include <utility>

namespace {

bool isSpace(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

} // namespace

void TextNormalizer::append(const char *data, std::size_t len,
                            std::string &out) {
  for (std::size_t i = 0; i < len; ++i) {
    unsigned char c = static_cast<unsigned char>(data[i]);

    if (isSpace(c)) {
      // Leading whitespace is dropped, inner runs collapse to one space
      if (m_started)
        m_pendingSpace = true;
      continue;
    }

    if (m_pendingSpace) {
      out.push_back(' ');
      m_pendingSpace = false;
    }

    if (c >= 'A' && c <= 'Z')
      c = static_cast<unsigned char>(c - 'A' + 'a');

    out.push_back(static_cast<char>(c));
    m_started = true;
  }
}

SignatureEngine::SignatureEngine(SignatureConfig config, Logger &logger)
    : m_config(std::move(config)), m_logger(logger) {
  m_config.validate();

  // Raw generator output only: std distributions are not reproducible
  // across standard library implementations.
  std::mt19937_64 gen(m_config.seed);
  m_a.reserve(m_config.numPerm);
  m_b.reserve(m_config.numPerm);
  for (std::size_t i = 0; i < m_config.numPerm; ++i) {
    m_a.push_back(gen() % 0xFFFFFFFFu + 1);
    m_b.push_back(gen() & 0xFFFFFFFFu);
  }
}

std::string SignatureEngine::normalize(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  TextNormalizer normalizer;
  normalizer.append(text.data(), text.size(), out);
  return out;
}

void SignatureEngine::foldRange(const char *data, std::size_t begin,
                                std::size_t end, Signature &sig) const {
  const std::size_t k = m_config.shingleSize;
  const std::size_t n = m_config.numPerm;

  if (end < begin + k)
    return;

  for (std::size_t p = begin; p + k <= end; ++p) {
    // a, b < 2^32 and h < 2^32 keep a * h + b below 2^64
    const uint64_t h = FNV1A::hash32(data + p, k);
    for (std::size_t i = 0; i < n; ++i) {
      const uint64_t v = (m_a[i] * h + m_b[i]) % PRIME;
      sig.update(i, static_cast<uint32_t>(v & 0xFFFFFFFFu));
    }
  }
}

void SignatureEngine::accumulate(std::string_view normalized,
                                 Signature &sig) const {
  foldRange(normalized.data(), 0, normalized.size(), sig);
}

Signature SignatureEngine::sign(std::string_view text) const {
  std::string normalized = normalize(text);
  if (normalized.size() > m_config.parallelThreshold)
    return signParallel(normalized);
  return signSequential(normalized);
}

Signature SignatureEngine::signSequential(std::string_view normalized) const {
  Signature sig(m_config.numPerm);
  accumulate(normalized, sig);
  return sig;
}

Signature SignatureEngine::signParallel(std::string_view normalized) const {
  const std::size_t k = m_config.shingleSize;
  const std::size_t chunk = m_config.chunkSize;
  const std::size_t len = normalized.size();

  if (len <= chunk)
    return signSequential(normalized);

  const std::size_t chunks = (len + chunk - 1) / chunk;
  std::vector<Signature> partials(chunks, Signature(m_config.numPerm));

  {
    boost::asio::thread_pool pool(
        std::min(m_config.effectiveWorkers(), chunks));

    for (std::size_t c = 0; c < chunks; ++c) {
      boost::asio::post(pool, [this, &partials, normalized, c, chunk, len]() {
        const std::size_t begin = c * chunk;
        const std::size_t end = std::min(len, begin + chunk);
        foldRange(normalized.data(), begin, end, partials[c]);
      });
    }

    pool.join();
  }

  Signature result(m_config.numPerm);
  for (const auto &partial : partials)
    result.merge(partial);

  // Shingles starting in the last k-1 bytes of a chunk run into the next
  // one; no chunk folded them.
  for (std::size_t c = 1; c < chunks; ++c) {
    const std::size_t boundary = c * chunk;
    const std::size_t begin = boundary - (k - 1);
    const std::size_t end = std::min(len, boundary + (k - 1));
    foldRange(normalized.data(), begin, end, result);
  }

  return result;
}

std::optional<Signature>
SignatureEngine::signFile(const std::filesystem::path &path,
                          const std::atomic<bool> *cancel) const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec)
    throw SigningError(ec.message(), path.string());

  std::ifstream file(path, std::ios::binary);
  if (!file)
    throw SigningError("cannot open file", path.string());

  if (size > m_config.parallelThreshold && m_config.effectiveWorkers() > 1) {
    if (cancel && cancel->load())
      return std::nullopt;

    std::string content(static_cast<std::size_t>(size), '\0');
    file.read(&content[0], static_cast<std::streamsize>(content.size()));
    if (file.bad())
      throw SigningError("read error", path.string());
    content.resize(static_cast<std::size_t>(file.gcount()));

    return sign(content);
  }

  StreamingSigner signer(*this);
  std::vector<char> buffer(READ_CHUNK);

  while (true) {
    if (cancel && cancel->load())
      return std::nullopt;

    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = file.gcount();
    if (got > 0)
      signer.update(buffer.data(), static_cast<std::size_t>(got));

    if (file.bad())
      throw SigningError("read error", path.string());
    if (!file)
      break; // eof
  }

  return signer.finish();
}

std::optional<Signature>
SignatureEngine::trySignFile(const std::filesystem::path &path,
                             const std::atomic<bool> *cancel) const {
  try {
    return signFile(path, cancel);
  } catch (const FileOperationError &e) {
    m_logger.warning("Failed to sign file",
                     {{"operation", "sign"},
                      {"path", path.string()},
                      {"error", e.what()}});
    return std::nullopt;
  }
}

std::unordered_set<std::string>
SignatureEngine::shingles(std::string_view text) const {
  const std::size_t k = m_config.shingleSize;
  const std::string normalized = normalize(text);

  std::unordered_set<std::string> result;
  for (std::size_t p = 0; p + k <= normalized.size(); ++p)
    result.insert(normalized.substr(p, k));
  return result;
}

double SignatureEngine::jaccard(const std::unordered_set<std::string> &a,
                                const std::unordered_set<std::string> &b) {
  if (a.empty() && b.empty())
    return 1.0;

  const auto &smaller = a.size() <= b.size() ? a : b;
  const auto &larger = a.size() <= b.size() ? b : a;

  std::size_t common = 0;
  for (const auto &s : smaller) {
    if (larger.count(s))
      ++common;
  }

  const std::size_t total = a.size() + b.size() - common;
  return static_cast<double>(common) / static_cast<double>(total);
}

StreamingSigner::StreamingSigner(const SignatureEngine &engine)
    : m_engine(engine), m_signature(engine.getConfig().numPerm) {}

void StreamingSigner::update(const char *data, std::size_t len) {
  m_consumed += len;
  m_normalizer.append(data, len, m_buffer);

  const std::size_t k = m_engine.getConfig().shingleSize;
  if (m_buffer.size() < k)
    return;

  m_engine.accumulate(m_buffer, m_signature);

  // keep the k-1 bytes whose shingles still need the next chunk
  m_buffer.erase(0, m_buffer.size() - (k - 1));
}
