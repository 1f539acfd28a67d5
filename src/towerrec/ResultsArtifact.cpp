#include "towerrec/ResultsArtifact.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace towerrec {

static const char* pipeline_str(Pipeline p) {
    switch (p) {
        case Pipeline::Music: return "music";
        case Pipeline::Movie: return "movie";
        default: return "unknown";
    }
}

double round_to(double v, int places) {
    const double scale = std::pow(10.0, places);
    return std::round(v * scale) / scale;
}

static nlohmann::json song_to_json(const Recommendation& r) {
    nlohmann::json j;
    j["id"] = r.id;
    j["title"] = r.title;
    j["artist"] = r.artist;
    j["album"] = r.album;
    j["genre"] = r.genre;
    j["mood"] = r.mood;
    j["similarity_score"] = r.similarity;
    return j;
}

static nlohmann::json movie_to_json(const Recommendation& r) {
    nlohmann::json j;
    j["movie_id"] = r.id;
    j["title"] = r.title;
    j["genres"] = r.genre;
    j["year"] = r.has_year ? nlohmann::json(r.year) : nlohmann::json(nullptr);
    j["avg_rating"] = r.rating_count > 0 ? nlohmann::json(round_to(r.avg_rating, 2)) : nlohmann::json(nullptr);
    j["rating_count"] = r.rating_count;
    j["similarity_score"] = r.similarity;
    if (r.has_predicted_rating) j["predicted_rating"] = round_to(r.predicted_rating, 1);
    return j;
}

nlohmann::json RecommendationsArtifact::to_json() const {
    nlohmann::json j;
    j["pipeline"] = pipeline_str(pipeline);
    j["user"] = user;
    j["limit"] = limit;
    j["count"] = recommendations.size();

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : recommendations) {
        arr.push_back(pipeline == Pipeline::Movie ? movie_to_json(r) : song_to_json(r));
    }
    j["recommendations"] = arr;

    return j;
}

void RecommendationsArtifact::write_to(const std::filesystem::path& out_path) const {
    write_json(out_path, to_json());
}

nlohmann::json summary_to_json(const RatingSummary& s) {
    return {
        {"total_ratings", s.total_ratings},
        {"unique_users", s.unique_users},
        {"unique_movies", s.unique_movies},
        {"movies_with_metadata", s.movies_with_metadata},
        {"avg_ratings_per_user", round_to(s.avg_ratings_per_user, 1)},
        {"avg_ratings_per_movie", round_to(s.avg_ratings_per_movie, 1)},
    };
}

void write_json(const std::filesystem::path& out_path, const nlohmann::json& j) {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << j.dump(2) << "\n";
}

}  // namespace towerrec
