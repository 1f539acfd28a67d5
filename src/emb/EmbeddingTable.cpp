#include "emb/EmbeddingTable.hpp"
#include <cstdint>
#include <fstream>
#include <stdexcept>

bool EmbeddingTable::add(const std::string& key, const std::vector<float>& vec) {
    if (vec.size() != m_dim) {
        throw std::invalid_argument("EmbeddingTable: vector for '" + key + "' has dim " +
                                    std::to_string(vec.size()) + ", table dim is " +
                                    std::to_string(m_dim));
    }
    if (!m_pos.emplace(key, m_keys.size()).second) return false;

    m_keys.push_back(key);
    m_vecs.insert(m_vecs.end(), vec.begin(), vec.end());
    return true;
}

const float* EmbeddingTable::find(const std::string& key) const {
    auto it = m_pos.find(key);
    if (it == m_pos.end()) return nullptr;
    return row(it->second);
}

std::vector<float> EmbeddingTable::vector_at(size_t i) const {
    const float* r = row(i);
    return std::vector<float>(r, r + m_dim);
}

bool EmbeddingTable::save(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) return false;

    uint32_t dim = (uint32_t)m_dim;
    uint32_t n = (uint32_t)m_keys.size();
    out.write((char*)&dim, sizeof(dim));
    out.write((char*)&n, sizeof(n));

    for (const auto& k : m_keys) {
        uint32_t len = (uint32_t)k.size();
        out.write((char*)&len, sizeof(len));
        out.write(k.data(), len);
    }

    uint64_t vec_count = (uint64_t)m_vecs.size();
    out.write((char*)&vec_count, sizeof(vec_count));
    out.write((char*)m_vecs.data(), (std::streamsize)(sizeof(float) * m_vecs.size()));
    return (bool)out;
}

bool EmbeddingTable::load(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    uint32_t dim = 0, n = 0;
    in.read((char*)&dim, sizeof(dim));
    in.read((char*)&n, sizeof(n));
    if (!in || dim == 0) return false;

    std::vector<std::string> keys;
    std::unordered_map<std::string, size_t> pos;
    keys.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t len = 0;
        in.read((char*)&len, sizeof(len));
        if (!in) return false;
        std::string s(len, '\0');
        in.read(s.data(), len);
        if (!in) return false;
        if (!pos.emplace(s, keys.size()).second) return false;
        keys.push_back(std::move(s));
    }

    uint64_t vec_count = 0;
    in.read((char*)&vec_count, sizeof(vec_count));
    if (!in || vec_count != (uint64_t)n * dim) return false;

    std::vector<float> vecs((size_t)vec_count);
    in.read((char*)vecs.data(), (std::streamsize)(sizeof(float) * vecs.size()));
    if (!in) return false;

    m_dim = dim;
    m_keys = std::move(keys);
    m_vecs = std::move(vecs);
    m_pos = std::move(pos);
    return true;
}
