// include/towerrec/ResultsArtifact.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "towerrec/Models.hpp"

namespace towerrec {

enum class Pipeline {
    Music,
    Movie
};

struct RecommendationsArtifact {
    Pipeline pipeline = Pipeline::Music;
    std::string user;
    size_t limit = 0;

    std::vector<Recommendation> recommendations;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

nlohmann::json summary_to_json(const RatingSummary& s);

// round half away from zero to `places` decimals (display values only)
double round_to(double v, int places);

// Serializes `j` with 2-space indent, creating parent directories.
void write_json(const std::filesystem::path& out_path, const nlohmann::json& j);

}  // namespace towerrec
