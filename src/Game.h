#ifndef GAME_H
#define GAME_H

#include <cstddef>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "DateUtils.h"

class Game {
public:
    Game() = default;
    Game(const std::string& name, const std::string& platform, const Date& releaseDate,
         const std::string& summary, int metaScore, double userReview);

    const std::string& getName() const;
    const std::string& getPlatform() const;
    const Date& getReleaseDate() const;
    const std::string& getSummary() const;
    int getMetaScore() const;
    double getUserReview() const;

    friend bool operator==(const Game& lhs, const Game& rhs);
    friend bool operator!=(const Game& lhs, const Game& rhs);

    friend void to_json(nlohmann::json& j, const Game& g);
    friend void from_json(const nlohmann::json& j, Game& g);

private:
    std::string name_;
    std::string platform_;
    Date releaseDate_;
    std::string summary_;
    int metaScore_ = 0;
    double userReview_ = 0.0;
};

namespace std {
template <>
struct hash<Game> {
    size_t operator()(const Game& g) const;
};
} // namespace std

#endif // GAME_H
