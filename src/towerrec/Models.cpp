#include "towerrec/Models.hpp"

#include "util/TextUtil.hpp"

namespace towerrec {

std::string song_key(const std::string& title, const std::string& artist, const std::string& source_id) {
    const std::string t = textutil::normalize_key(title);
    const std::string a = textutil::normalize_key(artist);
    if (t.empty() && a.empty()) return "::" + source_id;
    return t + "::" + a;
}

std::string song_key(const Song& s) {
    return song_key(s.title, s.artist, s.source_id);
}

std::string song_key(const ListenEvent& e) {
    return song_key(e.title, e.artist, e.source_id);
}

}  // namespace towerrec
