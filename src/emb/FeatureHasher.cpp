#include "emb/FeatureHasher.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace emb {

void hash_into(const std::string& text, std::vector<float>& vec,
               size_t offset, size_t band, float weight) {
    if (band == 0 || offset + band > vec.size()) {
        throw std::out_of_range("hash_into: band [" + std::to_string(offset) + ", " +
                                std::to_string(offset + band) + ") outside vector of size " +
                                std::to_string(vec.size()));
    }

    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(
            std::tolower(static_cast<unsigned char>(text[i])));
        vec[offset + (i % band)] += (static_cast<float>(c) / 255.0f) * weight;
    }
}

float hash_user_id(const std::string& id) {
    // h = h * 31 + c with 32-bit wrap; computed unsigned to keep overflow defined
    uint32_t h = 0;
    for (unsigned char c : id) h = h * 31u + static_cast<uint32_t>(c);

    const int64_t signed_h = static_cast<int32_t>(h);
    const int64_t mag = std::llabs(signed_h);
    return static_cast<float>(mag % 1000) / 1000.0f;
}

}  // namespace emb
