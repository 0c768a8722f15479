/**
 * @file signature.hpp
 * @brief MinHash sketch of a document's shingle set
 */

#ifndef SIGNATURE_HPP
#define SIGNATURE_HPP

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

/**
 * @class Signature
 * @brief Fixed-size array of per-permutation minimum hash values
 *
 * Position i holds the smallest value permutation i produced over all
 * shingles of a document. A freshly constructed signature has every position
 * at EMPTY_SLOT, which is also the defined signature of a document without
 * shingles (empty or shorter than the shingle width).
 *
 * Two signatures are comparable only when they have the same size.
 *
 * @see similarity()
 * @see SignatureEngine
 */
class Signature {
public:
  /** @brief Sentinel for a position no shingle has touched */
  static constexpr uint32_t EMPTY_SLOT = 0xFFFFFFFFu;

  Signature() = default;

  /** @brief Creates an empty signature with numPerm positions */
  explicit Signature(std::size_t numPerm) : m_values(numPerm, EMPTY_SLOT) {}

  explicit Signature(std::vector<uint32_t> values)
      : m_values(std::move(values)) {}

  std::size_t size() const { return m_values.size(); }
  const std::vector<uint32_t> &values() const { return m_values; }
  uint32_t operator[](std::size_t i) const { return m_values[i]; }

  /** @brief True if no shingle contributed to this signature */
  bool isEmpty() const;

  /**
   * @brief Lowers position i to value if value is smaller
   */
  void update(std::size_t i, uint32_t value) {
    if (value < m_values[i])
      m_values[i] = value;
  }

  /**
   * @brief Element-wise minimum with another signature of the same size
   *
   * Merging is commutative and associative, so partial signatures of a
   * document's pieces can be combined in any order.
   *
   * @throws InvalidArgumentError on size mismatch
   */
  void merge(const Signature &other);

  bool operator==(const Signature &other) const {
    return m_values == other.m_values;
  }
  bool operator!=(const Signature &other) const { return !(*this == other); }

private:
  std::vector<uint32_t> m_values;
};

/**
 * @brief Estimated Jaccard similarity: share of equal positions
 *
 * @return value in [0, 1]
 * @throws InvalidArgumentError if the sizes differ or are zero
 */
double similarity(const Signature &a, const Signature &b);

#endif // SIGNATURE_HPP
