#pragma once
#include <cstddef>
#include <vector>

namespace emb {

using Embedding = std::vector<float>;

double l2_norm(const float* v, size_t dim);

// dot / (|a| * |b|); 0 when either side is the zero vector
float cosine(const float* a, const float* b, size_t dim);

// Throws std::invalid_argument when the lengths differ.
float cosine(const Embedding& a, const Embedding& b);

// Divides by the euclidean norm in place; the zero vector stays zero.
void l2_normalize(Embedding& v);

}  // namespace emb
