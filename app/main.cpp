#include "commands/embed.hpp"
#include "commands/movie.hpp"
#include "commands/music.hpp"
#include "commands/stats.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  tower-rec music [args]\n"
        << "  tower-rec movie [args]\n"
        << "  tower-rec embed [args]\n"
        << "  tower-rec stats [args]\n"
        << "  tower-rec help\n";
    return 1;
}

static int print_music_help() {
    std::cerr
        << "usage:\n"
        << "  tower-rec music --history <rows.json> [options]\n"
        << "\n"
        << "inputs:\n"
        << "  --history <path>             (required) listening history rows\n"
        << "  --catalog <path>             default: deduplicated history\n"
        << "  --embeddings <path>          optional: load/save song embedding cache\n"
        << "\n"
        << "output:\n"
        << "  --limit <n>                  default: 10\n"
        << "  --user <label>               default: local\n"
        << "  --out <path>                 optional: write recommendations JSON\n";
    return 0;
}

static int print_movie_help() {
    std::cerr
        << "usage:\n"
        << "  tower-rec movie --ratings <rows.json> --user <id> [options]\n"
        << "\n"
        << "options:\n"
        << "  --movies <path>              optional: movie metadata rows (title, genres, year)\n"
        << "  --limit <n>                  default: 20\n"
        << "  --now <unix seconds>         default: current time (recency window anchor)\n"
        << "  --out <path>                 optional: write recommendations JSON\n";
    return 0;
}

static int print_embed_help() {
    std::cerr
        << "usage:\n"
        << "  tower-rec embed [options]\n"
        << "\n"
        << "options:\n"
        << "  --catalog <path>             (required) song rows\n"
        << "  --out <path>                 default: data/embeddings/songs.bin\n";
    return 0;
}

static int print_stats_help() {
    std::cerr
        << "usage:\n"
        << "  tower-rec stats --ratings <rows.json> [--movies <rows.json>] [--out <path>]\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    // subcommand help
    const bool help = argc >= 3 && std::string(argv[2]) == "--help";
    if (cmd == "music" && help) return print_music_help();
    if (cmd == "movie" && help) return print_movie_help();
    if (cmd == "embed" && help) return print_embed_help();
    if (cmd == "stats" && help) return print_stats_help();

    if (cmd == "music") return cmd_music(argc - 1, argv + 1);
    if (cmd == "movie") return cmd_movie(argc - 1, argv + 1);
    if (cmd == "embed") return cmd_embed(argc - 1, argv + 1);
    if (cmd == "stats") return cmd_stats(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
