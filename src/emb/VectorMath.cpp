#include "emb/VectorMath.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace emb {

double l2_norm(const float* v, size_t dim) {
    double ss = 0.0;
    for (size_t i = 0; i < dim; ++i) ss += (double)v[i] * (double)v[i];
    return std::sqrt(ss);
}

float cosine(const float* a, const float* b, size_t dim) {
    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < dim; ++i) {
        double x = a[i], y = b[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    double denom = std::sqrt(na) * std::sqrt(nb);
    if (denom == 0.0) denom = 1.0;

    // rounding can push |dot| a hair past the norms product
    double s = dot / denom;
    if (s > 1.0) s = 1.0;
    if (s < -1.0) s = -1.0;
    return (float)s;
}

float cosine(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("cosine: dimension mismatch (" + std::to_string(a.size()) +
                                    " vs " + std::to_string(b.size()) + ")");
    }
    return cosine(a.data(), b.data(), a.size());
}

void l2_normalize(Embedding& v) {
    double norm = l2_norm(v.data(), v.size());
    if (norm <= 0.0) norm = 1.0;
    const double inv = 1.0 / norm;
    for (float& x : v) x = (float)(x * inv);
}

}  // namespace emb
