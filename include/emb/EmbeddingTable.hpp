#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

// Ordered key -> vector table with a fixed dimension. Row order is insertion order,
// which is the catalog enumeration order used for tie-breaks when ranking.
class EmbeddingTable {
public:
    EmbeddingTable() = default;
    explicit EmbeddingTable(size_t dim) : m_dim(dim) {}

    // false if the key is already present (first seen wins).
    // throws std::invalid_argument if vec.size() != dim()
    bool add(const std::string& key, const std::vector<float>& vec);

    // nullptr when the key is unknown
    const float* find(const std::string& key) const;
    bool contains(const std::string& key) const { return m_pos.count(key) != 0; }

    const std::string& key(size_t i) const { return m_keys[i]; }
    const float* row(size_t i) const { return &m_vecs[i * m_dim]; }
    std::vector<float> vector_at(size_t i) const;

    // cache I/O (binary)
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    size_t dim() const { return m_dim; }
    size_t size() const { return m_keys.size(); }
    bool empty() const { return m_keys.empty(); }

private:
    size_t m_dim = 0;
    std::vector<std::string> m_keys;
    std::vector<float> m_vecs; // packed: size = size()*dim()
    std::unordered_map<std::string, size_t> m_pos;
};
