#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace emb {

// Adds (byte / 255) * weight of the lowercased text to vec[offset + (i % band)].
// Empty text contributes nothing. Throws std::out_of_range if the band does not fit.
void hash_into(const std::string& text, std::vector<float>& vec,
               size_t offset, size_t band, float weight);

// Java-style 32-bit string hash folded into [0, 1) with a step of 0.001.
float hash_user_id(const std::string& id);

}  // namespace emb
