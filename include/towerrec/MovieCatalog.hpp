#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "towerrec/Models.hpp"
#include "util/TextUtil.hpp"

namespace towerrec {

// Movie metadata keyed by normalized movie id; the first entry for an id wins.
class MovieCatalog {
public:
    bool add(MovieInfo info) {
        info.movie_id = textutil::normalize_key(info.movie_id);
        if (!m_index.emplace(info.movie_id, m_movies.size()).second) return false;
        m_movies.push_back(std::move(info));
        return true;
    }

    const MovieInfo* find(const std::string& movie_id) const {
        auto it = m_index.find(textutil::normalize_key(movie_id));
        return it == m_index.end() ? nullptr : &m_movies[it->second];
    }

    const std::vector<MovieInfo>& movies() const { return m_movies; }
    size_t size() const { return m_movies.size(); }

private:
    std::vector<MovieInfo> m_movies;
    std::unordered_map<std::string, size_t> m_index;
};

}  // namespace towerrec
