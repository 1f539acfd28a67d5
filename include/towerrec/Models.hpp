#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace towerrec {

// ---- music ----

struct Song {
    std::string source_id;           // opaque id from the provider (or the raw row)
    std::string title;
    std::string artist;
    std::string album;
    std::string genre;
    std::string sub_genre;
    std::string language;
    std::string mood;
    std::string activity;

    int release_year = 2020;
    double duration_sec = 200.0;

    // engagement snapshot carried by the catalog row
    double completion_rate = 0.5;    // 0..1
    double rating = 3.0;             // 1..5
    int liked = 0;
    int repeat_count = 0;
    int skipped = 0;
    int added_to_playlist = 0;

    // listening context
    int hour_of_day = 12;            // 0..23
    int weekend = 0;
    std::string weather;
    std::string location;
};

struct ListenEvent {
    std::string source_id;
    std::string title;
    std::string artist;

    double completion_rate = 0.5;
    double rating = 3.0;             // 1..5, rescaled to 0..1 when weighted
    int liked = 0;
    int skipped = 0;
    int repeat_count = 0;
};

// "title::artist" after trim + lowercase; "::<source_id>" when both are empty
std::string song_key(const std::string& title, const std::string& artist, const std::string& source_id);
std::string song_key(const Song& s);
std::string song_key(const ListenEvent& e);

// ---- movies ----

struct MovieRating {
    std::string user_id;             // normalized key
    std::string movie_id;            // normalized key
    double rating = 0.0;
    int64_t timestamp = 0;           // unix seconds
};

struct MovieInfo {
    std::string movie_id;            // normalized key
    std::string title;
    std::string genres;              // "Action|Comedy"
    bool has_year = false;
    int year = 0;
};

// ---- results ----

struct Recommendation {
    std::string id;                  // song key or movie id
    std::string title;
    std::string artist;              // music
    std::string album;               // music
    std::string genre;               // music genre / movie genre list
    std::string mood;                // music

    bool has_year = false;           // movies
    int year = 0;
    double avg_rating = 0.0;         // movies; 0 when unknown
    int rating_count = 0;

    float similarity = 0.0f;

    bool has_predicted_rating = false;
    double predicted_rating = 0.0;
};

struct RatingSummary {
    size_t total_ratings = 0;
    size_t unique_users = 0;
    size_t unique_movies = 0;
    size_t movies_with_metadata = 0;
    double avg_ratings_per_user = 0.0;
    double avg_ratings_per_movie = 0.0;
};

}  // namespace towerrec
