/**
 * @file signatureengine.hpp
 * @brief Shingling and MinHash signature computation
 *
 * This header defines the SignatureEngine, which turns text into Signatures,
 * and the StreamingSigner, which does the same for content that arrives in
 * arbitrary byte chunks.
 */

#ifndef SIGNATUREENGINE_HPP
#define SIGNATUREENGINE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "config.hpp"
#include "logger.hpp"
#include "signature.hpp"

/**
 * @class TextNormalizer
 * @brief Incremental text normalization
 *
 * Lower-cases ASCII letters, collapses every run of whitespace into a single
 * space and drops leading and trailing whitespace. Because a pending space
 * is only emitted once the next non-space byte arrives, feeding the input in
 * pieces gives exactly the same output as feeding it at once.
 */
class TextNormalizer {
public:
  /**
   * @brief Appends the normalized form of data to out
   */
  void append(const char *data, std::size_t len, std::string &out);

private:
  bool m_started = false;
  bool m_pendingSpace = false;
};

/**
 * @class SignatureEngine
 * @brief Computes MinHash signatures over k-byte shingles of normalized text
 *
 * Every shingle is hashed with FNV-1a (folded to 32 bits) and then passed
 * through N universal-hash permutations
 *
 *     perm_i(h) = ((a_i * h + b_i) mod P) & 0xFFFFFFFF,   P = 2^32 + 15
 *
 * whose coefficients come from a std::mt19937_64 seeded with the configured
 * seed. Engines with equal configuration therefore produce identical
 * signatures, in any process.
 *
 * Texts larger than SignatureConfig::parallelThreshold are split into
 * fixed-size chunks that are folded on a bounded boost::asio::thread_pool.
 * Each chunk only folds the shingles lying wholly inside it; the shingles
 * straddling a chunk boundary are folded after all chunks are joined. The
 * result equals the sequential pass bit for bit.
 *
 * The engine is immutable after construction and may be shared between
 * threads.
 *
 * @see Signature
 * @see StreamingSigner
 */
class SignatureEngine {
public:
  /** @brief Prime modulus of the permutations */
  static constexpr uint64_t PRIME = 4294967311u;

  /** @brief Read size used by signFile() */
  static constexpr std::size_t READ_CHUNK = 8 * 1024;

  /**
   * @throws InvalidArgumentError if config is invalid
   */
  explicit SignatureEngine(SignatureConfig config = {},
                           Logger &logger = Logger::instance());

  const SignatureConfig &getConfig() const { return m_config; }

  /**
   * @brief Normalizes text (see TextNormalizer)
   */
  static std::string normalize(std::string_view text);

  /**
   * @brief Signs raw text
   *
   * Normalizes first, then takes the parallel path if the normalized text is
   * larger than the parallel threshold.
   */
  Signature sign(std::string_view text) const;

  /** @brief Single-threaded signing of already normalized text */
  Signature signSequential(std::string_view normalized) const;

  /**
   * @brief Chunked signing of already normalized text on the worker pool
   *
   * Falls back to signSequential() when the text fits in one chunk.
   */
  Signature signParallel(std::string_view normalized) const;

  /**
   * @brief Folds every complete shingle of normalized into sig
   */
  void accumulate(std::string_view normalized, Signature &sig) const;

  /**
   * @brief Signs a file's content
   *
   * Files above the parallel threshold are loaded and signed in parallel;
   * everything else is streamed in READ_CHUNK pieces. The cancel flag is
   * polled between pieces.
   *
   * @return the signature, or std::nullopt if cancelled (a partially computed
   *         sketch is discarded, never returned)
   * @throws SigningError if the file cannot be opened or read
   */
  std::optional<Signature>
  signFile(const std::filesystem::path &path,
           const std::atomic<bool> *cancel = nullptr) const;

  /**
   * @brief signFile() that reports failures as std::nullopt
   *
   * The failure is logged as a warning with the path and reason.
   */
  std::optional<Signature>
  trySignFile(const std::filesystem::path &path,
              const std::atomic<bool> *cancel = nullptr) const;

  /**
   * @brief Distinct shingles of the normalized text
   *
   * Not used for signing. Exposed to measure the true Jaccard similarity a
   * signature estimates.
   */
  std::unordered_set<std::string> shingles(std::string_view text) const;

  /**
   * @brief Exact Jaccard similarity of two shingle sets
   *
   * Two empty sets are defined as identical (1.0).
   */
  static double jaccard(const std::unordered_set<std::string> &a,
                        const std::unordered_set<std::string> &b);

private:
  void foldRange(const char *data, std::size_t begin, std::size_t end,
                 Signature &sig) const;

  SignatureConfig m_config;
  std::vector<uint64_t> m_a;
  std::vector<uint64_t> m_b;
  Logger &m_logger;
};

/**
 * @class StreamingSigner
 * @brief Signs content fed in arbitrary byte chunks
 *
 * Normalized bytes accumulate in a sliding buffer. After each update every
 * complete shingle is folded and only the last k-1 bytes are kept, so that
 * shingles spanning two chunks are never lost and memory stays bounded by
 * the chunk size.
 *
 * @code
 * StreamingSigner signer(engine);
 * while (reader.next(chunk))
 *   signer.update(chunk);
 * Signature sig = signer.finish();
 * @endcode
 */
class StreamingSigner {
public:
  explicit StreamingSigner(const SignatureEngine &engine);

  void update(const char *data, std::size_t len);
  void update(std::string_view chunk) { update(chunk.data(), chunk.size()); }

  /** @brief Returns the signature of everything fed so far */
  Signature finish() const { return m_signature; }

  /** @brief Raw (pre-normalization) bytes consumed */
  std::size_t bytesConsumed() const { return m_consumed; }

private:
  const SignatureEngine &m_engine;
  TextNormalizer m_normalizer;
  std::string m_buffer;
  Signature m_signature;
  std::size_t m_consumed = 0;
};

#endif // SIGNATUREENGINE_HPP
