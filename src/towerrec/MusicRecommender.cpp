#include "towerrec/MusicRecommender.hpp"

#include <stdexcept>
#include <string>

#include "towerrec/ListenerEncoder.hpp"
#include "towerrec/Ranker.hpp"
#include "towerrec/RowNormalizer.hpp"
#include "towerrec/SongEncoder.hpp"

namespace towerrec {

void MusicRecommender::train(const std::vector<Song>& songs) {
    auto snap = std::make_shared<MusicSnapshot>();
    snap->catalog = dedupe_songs(songs);
    snap->table = encode_catalog(snap->catalog);
    install(std::move(snap));
}

void MusicRecommender::publish(const std::vector<Song>& songs, const EmbeddingTable& table) {
    if (table.dim() != kSongDim) {
        throw std::invalid_argument("MusicRecommender: embedding dim " + std::to_string(table.dim()) +
                                    ", expected " + std::to_string(kSongDim));
    }

    auto snap = std::make_shared<MusicSnapshot>();
    snap->catalog = dedupe_songs(songs);
    snap->table = EmbeddingTable(kSongDim);

    for (const auto& s : snap->catalog) {
        const std::string key = song_key(s);
        const float* v = table.find(key);
        if (!v) throw std::runtime_error("MusicRecommender: no embedding for '" + key + "'");
        snap->table.add(key, std::vector<float>(v, v + kSongDim));
    }
    install(std::move(snap));
}

void MusicRecommender::install(std::shared_ptr<const MusicSnapshot> snap) {
    std::lock_guard<std::mutex> lock(m_mu);
    m_snap = std::move(snap);
}

bool MusicRecommender::trained() const {
    return snapshot() != nullptr;
}

std::shared_ptr<const MusicSnapshot> MusicRecommender::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mu);
    return m_snap;
}

std::shared_ptr<const MusicSnapshot> MusicRecommender::require_snapshot() const {
    auto snap = snapshot();
    if (!snap) throw std::runtime_error("MusicRecommender: song embeddings not trained");
    return snap;
}

std::vector<float> MusicRecommender::user_embedding(const std::vector<ListenEvent>& history) const {
    return encode_listener(history, require_snapshot()->table);
}

std::vector<Recommendation> MusicRecommender::recommend(const std::vector<ListenEvent>& history,
                                                        size_t limit) const {
    const auto snap = require_snapshot();

    std::vector<Recommendation> out;
    if (snap->catalog.empty() || history.empty()) return out;

    const std::vector<float> user = encode_listener(history, snap->table);
    const auto hits = rank_table(user, snap->table, limit);

    out.reserve(hits.size());
    for (const auto& h : hits) {
        const Song& s = snap->catalog[h.row];

        Recommendation r;
        r.id = h.key;
        r.title = s.title;
        r.artist = s.artist;
        r.album = s.album;
        r.genre = s.genre;
        r.mood = s.mood;
        r.similarity = h.score;
        out.push_back(std::move(r));
    }
    return out;
}

}  // namespace towerrec
