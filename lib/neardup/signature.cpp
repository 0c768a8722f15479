#include "signature.hpp"
#include "errors.hpp"

#include <algorithm>
#include <string>

bool Signature::isEmpty() const {
  return std::all_of(m_values.begin(), m_values.end(),
                     [](uint32_t v) { return v == EMPTY_SLOT; });
}

void Signature::merge(const Signature &other) {
  if (other.size() != size()) {
    throw InvalidArgumentError("cannot merge signatures of size " +
                               std::to_string(size()) + " and " +
                               std::to_string(other.size()));
  }
  for (std::size_t i = 0; i < m_values.size(); ++i)
    update(i, other.m_values[i]);
}

double similarity(const Signature &a, const Signature &b) {
  if (a.size() != b.size()) {
    throw InvalidArgumentError("cannot compare signatures of size " +
                               std::to_string(a.size()) + " and " +
                               std::to_string(b.size()));
  }
  if (a.size() == 0)
    throw InvalidArgumentError("cannot compare zero-length signatures");

  std::size_t equal = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i] == b[i])
      ++equal;
  }
  return static_cast<double>(equal) / static_cast<double>(a.size());
}
