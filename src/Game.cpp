#include "Game.h"
#include <stdexcept>

static void hashCombine(std::size_t& seed, std::size_t value) {
    seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

Game::Game(const std::string& name, const std::string& platform, const Date& releaseDate,
           const std::string& summary, int metaScore, double userReview)
    : name_(name), platform_(platform), releaseDate_(releaseDate), summary_(summary),
      metaScore_(metaScore), userReview_(userReview) {}

const std::string& Game::getName() const { return name_; }
const std::string& Game::getPlatform() const { return platform_; }
const Date& Game::getReleaseDate() const { return releaseDate_; }
const std::string& Game::getSummary() const { return summary_; }
int Game::getMetaScore() const { return metaScore_; }
double Game::getUserReview() const { return userReview_; }

bool operator==(const Game& lhs, const Game& rhs) {
    return lhs.name_ == rhs.name_ &&
           lhs.platform_ == rhs.platform_ &&
           lhs.releaseDate_ == rhs.releaseDate_ &&
           lhs.summary_ == rhs.summary_ &&
           lhs.metaScore_ == rhs.metaScore_ &&
           lhs.userReview_ == rhs.userReview_;
}

bool operator!=(const Game& lhs, const Game& rhs) { return !(lhs == rhs); }

void to_json(nlohmann::json& j, const Game& g) {
    j = nlohmann::json{
        {"name", g.name_},
        {"platform", g.platform_},
        {"releaseDate", formatIsoDate(g.releaseDate_)},
        {"summary", g.summary_},
        {"metaScore", g.metaScore_},
        {"userReview", g.userReview_}
    };
}

void from_json(const nlohmann::json& j, Game& g) {
    j.at("name").get_to(g.name_);
    j.at("platform").get_to(g.platform_);
    if (g.name_.empty() || g.platform_.empty()) {
        throw std::invalid_argument("Game name and platform must not be empty.");
    }

    std::string releaseDate = j.at("releaseDate").get<std::string>();
    if (!parseIsoDate(releaseDate, g.releaseDate_)) {
        throw std::invalid_argument("Invalid release date in JSON: " + releaseDate);
    }

    j.at("summary").get_to(g.summary_);
    j.at("metaScore").get_to(g.metaScore_);
    j.at("userReview").get_to(g.userReview_);
}

namespace std {

size_t hash<Game>::operator()(const Game& g) const {
    size_t seed = 0;
    hashCombine(seed, hash<string>()(g.getName()));
    hashCombine(seed, hash<string>()(g.getPlatform()));
    hashCombine(seed, hash<int>()(g.getReleaseDate().year));
    hashCombine(seed, hash<int>()(g.getReleaseDate().month));
    hashCombine(seed, hash<int>()(g.getReleaseDate().day));
    hashCombine(seed, hash<string>()(g.getSummary()));
    hashCombine(seed, hash<int>()(g.getMetaScore()));
    hashCombine(seed, hash<double>()(g.getUserReview()));
    return seed;
}

} // namespace std
