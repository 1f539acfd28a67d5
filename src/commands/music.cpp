#include "commands/music.hpp"

#include "emb/EmbeddingTable.hpp"
#include "io/JsonIO.hpp"
#include "towerrec/MusicRecommender.hpp"
#include "towerrec/ResultsArtifact.hpp"
#include "towerrec/RowNormalizer.hpp"
#include "towerrec/SongEncoder.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoi(s); } catch (const std::exception&) { return def; }
}

static int music_usage() {
    std::cerr
        << "usage:\n"
        << "  tower-rec music --history <rows.json> [--catalog <rows.json>] [--limit <n>]\n"
        << "                  [--embeddings <cache.bin>] [--user <label>] [--out <path>]\n";
    return 1;
}

static bool load_cached(towerrec::MusicRecommender& rec,
                        const std::vector<towerrec::Song>& catalog,
                        const std::string& cache_path) {
    EmbeddingTable cached;
    if (!cached.load(cache_path)) return false;

    try {
        rec.publish(catalog, cached);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "warning: ignoring embedding cache " << cache_path << ": " << e.what() << "\n";
        return false;
    }
}

int cmd_music(int argc, char** argv) {
    try {
        const std::string history_path = get_arg(argc, argv, "--history", "");
        const std::string catalog_path = get_arg(argc, argv, "--catalog", "");
        const std::string cache_path   = get_arg(argc, argv, "--embeddings", "");
        const std::string user         = get_arg(argc, argv, "--user", "local");
        const std::string out_path     = get_arg(argc, argv, "--out", "");

        towerrec::MusicConfig cfg;
        const int limit_i = get_arg_int(argc, argv, "--limit", (int)cfg.limit);
        cfg.limit = limit_i < 0 ? 0 : (size_t)limit_i;

        if (history_path.empty()) {
            std::cerr << "error: missing --history\n";
            return music_usage();
        }

        std::vector<towerrec::ListenEvent> history;
        std::vector<towerrec::Song> history_songs;
        for (const auto& row : loadRows(history_path)) {
            history.push_back(towerrec::normalize_listen_row(row));
            history_songs.push_back(towerrec::normalize_song_row(row));
        }

        // without a separate catalog the history itself is the catalog
        std::vector<towerrec::Song> catalog;
        if (!catalog_path.empty()) {
            for (const auto& row : loadRows(catalog_path)) catalog.push_back(towerrec::normalize_song_row(row));
        } else {
            catalog = std::move(history_songs);
        }

        towerrec::MusicRecommender rec;
        bool from_cache = false;
        if (!cache_path.empty() && fs::exists(cache_path)) {
            from_cache = load_cached(rec, catalog, cache_path);
        }
        if (!from_cache) {
            rec.train(catalog);
            if (!cache_path.empty()) {
                const fs::path cp(cache_path);
                if (cp.has_parent_path()) fs::create_directories(cp.parent_path());
                if (!rec.snapshot()->table.save(cache_path)) {
                    std::cerr << "warning: failed to save embeddings to " << cache_path << "\n";
                }
            }
        }

        const auto recs = rec.recommend(history, cfg.limit);

        std::cout << "HISTORY: " << history.size() << "\n";
        std::cout << "CATALOG: " << rec.snapshot()->catalog.size() << "\n";
        std::cout << "EMBEDDINGS: " << (from_cache ? "cache" : "trained") << "\n";
        std::cout << "RECOMMENDATIONS: " << recs.size() << "\n";
        for (size_t i = 0; i < recs.size(); ++i) {
            const auto& r = recs[i];
            std::cout << std::setw(3) << (i + 1) << ". " << r.title << " - " << r.artist
                      << " [" << r.genre << "] " << std::fixed << std::setprecision(4) << r.similarity << "\n";
        }

        if (!out_path.empty()) {
            towerrec::RecommendationsArtifact artifact;
            artifact.pipeline = towerrec::Pipeline::Music;
            artifact.user = user;
            artifact.limit = cfg.limit;
            artifact.recommendations = recs;
            artifact.write_to(out_path);
            std::cout << "OUT_RECS: " << out_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "music failed: " << e.what() << "\n";
        return 1;
    }
}
