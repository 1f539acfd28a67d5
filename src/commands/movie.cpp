#include "commands/movie.hpp"

#include "io/JsonIO.hpp"
#include "towerrec/MovieRecommender.hpp"
#include "towerrec/ResultsArtifact.hpp"
#include "towerrec/RowNormalizer.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

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

static int64_t get_arg_int64(int argc, char** argv, const std::string& key, int64_t def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try { return std::stoll(s); } catch (const std::exception&) { return def; }
}

static int movie_usage() {
    std::cerr
        << "usage:\n"
        << "  tower-rec movie --ratings <rows.json> --user <id> [--movies <rows.json>]\n"
        << "                  [--limit <n>] [--now <unix seconds>] [--out <path>]\n";
    return 1;
}

int cmd_movie(int argc, char** argv) {
    try {
        const std::string ratings_path = get_arg(argc, argv, "--ratings", "");
        const std::string movies_path  = get_arg(argc, argv, "--movies", "");
        const std::string user         = get_arg(argc, argv, "--user", "");
        const std::string out_path     = get_arg(argc, argv, "--out", "");

        towerrec::MovieConfig cfg;
        const int limit_i = get_arg_int(argc, argv, "--limit", (int)cfg.limit);
        cfg.limit = limit_i < 0 ? 0 : (size_t)limit_i;
        cfg.now = get_arg_int64(argc, argv, "--now", (int64_t)std::time(nullptr));

        if (ratings_path.empty() || user.empty()) {
            std::cerr << "error: missing --ratings and/or --user\n";
            return movie_usage();
        }

        size_t dropped = 0;
        const auto ratings = towerrec::normalize_rating_rows(loadRows(ratings_path), cfg.now, &dropped);
        if (dropped) std::cerr << "warning: dropped " << dropped << " rating rows without user/movie id\n";
        if (ratings.empty()) {
            std::cerr << "error: no valid ratings in " << ratings_path << "\n";
            return 1;
        }

        std::vector<towerrec::MovieInfo> movies;
        if (!movies_path.empty()) {
            movies = towerrec::normalize_movie_rows(loadRows(movies_path), &dropped);
            if (dropped) std::cerr << "warning: dropped " << dropped << " movie rows without movie id\n";
        }

        towerrec::MovieRecommender rec;
        rec.train(ratings, movies, cfg);

        const auto recs = rec.recommend(user, cfg.limit);
        const auto snap = rec.snapshot();

        std::cout << "RATINGS: " << ratings.size() << "\n";
        std::cout << "MOVIES_TRAINED: " << snap->table.size() << "\n";
        std::cout << "USER: " << user << (snap->stats.find_user(user) ? "" : " (unknown)") << "\n";
        std::cout << "RECOMMENDATIONS: " << recs.size() << "\n";
        for (size_t i = 0; i < recs.size(); ++i) {
            const auto& r = recs[i];
            std::cout << std::setw(3) << (i + 1) << ". " << r.title << " [" << r.genre << "] "
                      << std::fixed << std::setprecision(4) << r.similarity
                      << " predicted=" << std::setprecision(1) << r.predicted_rating << "\n";
        }

        if (!out_path.empty()) {
            towerrec::RecommendationsArtifact artifact;
            artifact.pipeline = towerrec::Pipeline::Movie;
            artifact.user = user;
            artifact.limit = cfg.limit;
            artifact.recommendations = recs;
            artifact.write_to(out_path);
            std::cout << "OUT_RECS: " << out_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "movie failed: " << e.what() << "\n";
        return 1;
    }
}
