#include "GameCatalog.h"
#include "CatalogErrors.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

static bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// --- KeywordSearchResult ---

KeywordSearchResult::KeywordSearchResult(Status status, std::vector<Game> games)
    : status_(status), games_(std::move(games)) {}

KeywordSearchResult KeywordSearchResult::matches(std::vector<Game> games) {
    return KeywordSearchResult(Status::Ok, std::move(games));
}

KeywordSearchResult KeywordSearchResult::invalidKeywords() {
    return KeywordSearchResult(Status::InvalidKeywords, {});
}

KeywordSearchResult::Status KeywordSearchResult::status() const { return status_; }

bool KeywordSearchResult::ok() const { return status_ == Status::Ok; }

const std::vector<Game>& KeywordSearchResult::games() const {
    if (status_ != Status::Ok) {
        throw std::logic_error("Keyword search was rejected: keywords must be non-blank.");
    }
    return games_;
}

// --- Loading ---

GameCatalog::GameCatalog(std::istream& input, const LoaderOptions& options) {
    load(input, GameLoader(options));
}

GameCatalog GameCatalog::fromFile(const std::string& path, const LoaderOptions& options) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }
    return GameCatalog(ifs, options);
}

void GameCatalog::load(std::istream& input, const GameLoader& loader) {
    std::string line;
    std::size_t lineNumber = 0;

    // The first line is a header whatever it contains
    if (std::getline(input, line)) {
        ++lineNumber;
        while (std::getline(input, line)) {
            ++lineNumber;
            ++loadReport_.linesRead;

            std::optional<Game> game;
            try {
                game = loader.parseLine(line);
            } catch (const InvalidGameDataException& e) {
                throw InvalidGameDataException("Line " + std::to_string(lineNumber) + ": " + e.what());
            }

            if (!game) {
                loadReport_.skippedLines.push_back(lineNumber);
                std::size_t fieldCount = loader.splitFields(line).size();
                if (fieldCount == GameLoader::kFieldCount) {
                    spdlog::debug("Skipping line {}: empty name or platform", lineNumber);
                } else {
                    spdlog::debug("Skipping line {}: expected {} fields, got {}",
                                  lineNumber, GameLoader::kFieldCount, fieldCount);
                }
                continue;
            }
            games_.push_back(std::move(*game));
        }
    }

    if (input.bad()) {
        loadReport_.ioFailed = true;
        spdlog::warn("Read error after line {}, keeping {} games loaded so far",
                     lineNumber, games_.size());
    }

    spdlog::info("Loaded {} games, skipped {} lines",
                 games_.size(), loadReport_.skippedLines.size());
}

const LoadReport& GameCatalog::getLoadReport() const {
    return loadReport_;
}

// --- Queries ---

const std::vector<Game>& GameCatalog::getAllGames() const {
    return games_;
}

std::vector<Game> GameCatalog::getGamesReleasedAfter(const Date& date) const {
    std::vector<Game> results;
    for (const auto& game : games_) {
        if (game.getReleaseDate() > date) {
            results.push_back(game);
        }
    }
    return results;
}

std::vector<Game> GameCatalog::getTopNUserRatedGames(int n) const {
    if (n <= 0) {
        throw std::invalid_argument("n must be positive, got " + std::to_string(n) + ".");
    }

    std::vector<Game> sorted = games_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Game& a, const Game& b) {
                         return a.getUserReview() > b.getUserReview();
                     });

    if (static_cast<std::size_t>(n) < sorted.size()) {
        sorted.resize(static_cast<std::size_t>(n));
    }
    return sorted;
}

std::set<int> GameCatalog::getYearsWithTopScoringGames(int minimalScore) const {
    std::set<int> years;
    for (const auto& game : games_) {
        if (game.getMetaScore() >= minimalScore) {
            years.insert(game.getReleaseDate().year);
        }
    }
    return years;
}

std::string GameCatalog::getAllNamesOfGamesReleasedIn(int year) const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& game : games_) {
        if (game.getReleaseDate().year != year) continue;
        if (!first) oss << ", ";
        oss << game.getName();
        first = false;
    }
    return oss.str();
}

Game GameCatalog::getHighestUserRatedGameByPlatform(const std::string& platform) const {
    if (platform.empty()) {
        throw GameNotFoundException("Platform must not be empty.");
    }

    const Game* best = nullptr;
    for (const auto& game : games_) {
        if (game.getPlatform() != platform) continue;
        if (!best || game.getUserReview() > best->getUserReview()) {
            best = &game;
        }
    }

    if (!best) {
        throw GameNotFoundException("No games found for platform " + platform + ".");
    }
    return *best;
}

std::map<std::string, std::unordered_set<Game>> GameCatalog::getAllGamesByPlatform() const {
    std::map<std::string, std::unordered_set<Game>> byPlatform;
    for (const auto& game : games_) {
        byPlatform[game.getPlatform()].insert(game);
    }
    return byPlatform;
}

int GameCatalog::getYearsActive(const std::string& platform) const {
    if (isBlank(platform)) return 0;

    bool found = false;
    int startYear = 0;
    int endYear = 0;
    for (const auto& game : games_) {
        if (game.getPlatform() != platform) continue;
        int year = game.getReleaseDate().year;
        if (!found) {
            startYear = year;
            endYear = year;
            found = true;
        } else {
            startYear = std::min(startYear, year);
            endYear = std::max(endYear, year);
        }
    }

    if (!found) return 0;
    if (startYear == endYear) return 1;
    return endYear - startYear;
}

KeywordSearchResult GameCatalog::getGamesSimilarTo(const std::vector<std::string>& keywords) const {
    if (keywords.empty()) {
        return KeywordSearchResult::invalidKeywords();
    }
    for (const auto& keyword : keywords) {
        if (isBlank(keyword)) {
            return KeywordSearchResult::invalidKeywords();
        }
    }

    std::vector<Game> results;
    for (const auto& game : games_) {
        const std::string& summary = game.getSummary();
        bool containsAll = std::all_of(keywords.begin(), keywords.end(),
                                       [&](const std::string& keyword) {
                                           return summary.find(keyword) != std::string::npos;
                                       });
        if (containsAll) {
            results.push_back(game);
        }
    }
    return KeywordSearchResult::matches(std::move(results));
}
