#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "emb/EmbeddingTable.hpp"
#include "towerrec/Models.hpp"

namespace towerrec {

struct MusicConfig {
    size_t limit = 10;
};

// Immutable once published. table row i belongs to catalog[i].
struct MusicSnapshot {
    std::vector<Song> catalog;      // deduplicated, first seen wins
    EmbeddingTable table;
};

class MusicRecommender {
public:
    // Dedupe + encode the whole catalog, then swap the new snapshot in.
    void train(const std::vector<Song>& songs);

    // Install previously trained vectors (e.g. a loaded cache). The table is re-laid
    // out in catalog order. Throws std::invalid_argument on a dimension mismatch and
    // std::runtime_error if a catalog song has no vector in `table`.
    void publish(const std::vector<Song>& songs, const EmbeddingTable& table);

    bool trained() const;
    std::shared_ptr<const MusicSnapshot> snapshot() const;

    std::vector<float> user_embedding(const std::vector<ListenEvent>& history) const;

    // Whole catalog ranked, no exclusions. Empty catalog or history -> empty list.
    // Throws std::runtime_error before the first train()/publish().
    std::vector<Recommendation> recommend(const std::vector<ListenEvent>& history,
                                          size_t limit = MusicConfig{}.limit) const;

private:
    std::shared_ptr<const MusicSnapshot> require_snapshot() const;
    void install(std::shared_ptr<const MusicSnapshot> snap);

    mutable std::mutex m_mu;
    std::shared_ptr<const MusicSnapshot> m_snap;
};

}  // namespace towerrec
