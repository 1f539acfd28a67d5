#include "commands/embed.hpp"

#include "io/JsonIO.hpp"
#include "towerrec/MusicRecommender.hpp"
#include "towerrec/RowNormalizer.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (argv[i] == key) return argv[i + 1];
    }
    return def;
}

int cmd_embed(int argc, char** argv) {
    std::string catalog_path = get_arg(argc, argv, "--catalog", "");
    std::string outp         = get_arg(argc, argv, "--out", "data/embeddings/songs.bin");

    if (catalog_path.empty()) {
        std::cerr << "error: missing --catalog\n";
        return 1;
    }

    std::vector<towerrec::Song> songs;
    try {
        for (const auto& row : loadRows(catalog_path)) songs.push_back(towerrec::normalize_song_row(row));
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    towerrec::MusicRecommender rec;
    rec.train(songs);
    const auto snap = rec.snapshot();

    for (size_t i = 0; i < snap->table.size(); ++i) {
        std::cout << "embedded " << snap->table.key(i) << "\n";
    }
    if (songs.size() != snap->catalog.size()) {
        std::cout << "deduplicated " << (songs.size() - snap->catalog.size()) << " rows\n";
    }

    const std::filesystem::path op(outp);
    if (op.has_parent_path()) std::filesystem::create_directories(op.parent_path());

    if (!snap->table.save(outp)) {
        std::cerr << "error: failed to save embeddings to " << outp << "\n";
        return 1;
    }

    std::cout << "saved: " << outp << " (n=" << snap->table.size() << ", dim=" << snap->table.dim() << ")\n";
    return 0;
}
