#include "commands/stats.hpp"

#include "io/JsonIO.hpp"
#include "towerrec/MovieRecommender.hpp"
#include "towerrec/ResultsArtifact.hpp"
#include "towerrec/RowNormalizer.hpp"

#include <cstdint>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_stats(int argc, char** argv) {
    try {
        const std::string ratings_path = get_arg(argc, argv, "--ratings", "");
        const std::string movies_path  = get_arg(argc, argv, "--movies", "");
        const std::string out_path     = get_arg(argc, argv, "--out", "");

        if (ratings_path.empty()) {
            std::cerr << "error: missing --ratings\n";
            return 1;
        }

        towerrec::MovieConfig cfg;
        cfg.now = (int64_t)std::time(nullptr);

        const auto ratings = towerrec::normalize_rating_rows(loadRows(ratings_path), cfg.now);
        std::vector<towerrec::MovieInfo> movies;
        if (!movies_path.empty()) movies = towerrec::normalize_movie_rows(loadRows(movies_path));

        towerrec::MovieRecommender rec;
        rec.train(ratings, movies, cfg);

        const nlohmann::json j = towerrec::summary_to_json(rec.summary());
        std::cout << j.dump(2) << "\n";

        if (!out_path.empty()) {
            towerrec::write_json(out_path, j);
            std::cout << "OUT_STATS: " << out_path << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "stats failed: " << e.what() << "\n";
        return 1;
    }
}
