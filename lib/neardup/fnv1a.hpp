#ifndef FNV1A_HPP
#define FNV1A_HPP

#include <cstddef>
#include <cstdint>

/**
 * @brief FNV-1a (Fowler-Noll-Vo) hashing of shingles
 *
 * FNV-1a is a non-cryptographic hash function designed for fast hash table
 * lookup. It is the base hash every shingle goes through before the MinHash
 * permutations are applied. This implementation uses the 64-bit version:
 * - FNV prime: 2^40 + 2^8 + 0xb3 (1099511628211)
 * - FNV offset basis: 14695981039346656037
 *
 * The 64-bit value is folded to 32 bits (high half XOR low half) because the
 * permutations operate modulo a prime just above 2^32.
 *
 * @see http://www.isthe.com/chongo/tech/comp/fnv/
 */
struct FNV1A {
  static constexpr uint64_t PRIME = 1099511628211u;
  static constexpr uint64_t OFFSET_BASIS = 14695981039346656037u;

  static uint64_t hash64(const char *data, std::size_t len) {
    uint64_t hash = OFFSET_BASIS;
    for (std::size_t i = 0; i < len; ++i) {
      hash ^= static_cast<unsigned char>(data[i]);
      hash *= PRIME;
    }
    return hash;
  }

  static uint32_t hash32(const char *data, std::size_t len) {
    uint64_t hash = hash64(data, len);
    return static_cast<uint32_t>(hash ^ (hash >> 32));
  }
};

#endif // FNV1A_HPP
