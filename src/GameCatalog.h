#ifndef GAME_CATALOG_H
#define GAME_CATALOG_H

#include <cstddef>
#include <istream>
#include <map>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>
#include "CatalogConfig.h"
#include "DateUtils.h"
#include "Game.h"
#include "GameLoader.h"

/**
 * @brief What happened while the catalog was read from its source
 */
struct LoadReport {
    std::size_t linesRead = 0;             // data lines, header excluded
    std::vector<std::size_t> skippedLines; // 1-based source line numbers
    bool ioFailed = false;
};

/**
 * @brief Outcome of a keyword search: either the matches or a rejected query
 */
class KeywordSearchResult {
public:
    enum class Status { Ok, InvalidKeywords };

    static KeywordSearchResult matches(std::vector<Game> games);
    static KeywordSearchResult invalidKeywords();

    Status status() const;
    bool ok() const;

    // Throws std::logic_error if the search was rejected.
    const std::vector<Game>& games() const;

private:
    KeywordSearchResult(Status status, std::vector<Game> games);

    Status status_;
    std::vector<Game> games_;
};

/**
 * @brief Read-only catalog of games with reporting queries.
 *
 * Loaded once from a delimited text source whose first line is a header.
 * Nothing mutates the game list after construction, so const queries may be
 * called from several threads at once.
 */
class GameCatalog {
public:
    /**
     * @brief Load the catalog from a stream of lines
     * @throws InvalidGameDataException if any line carries an unparseable date or score
     */
    explicit GameCatalog(std::istream& input, const LoaderOptions& options = LoaderOptions{});

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    static GameCatalog fromFile(const std::string& path, const LoaderOptions& options = LoaderOptions{});

    const std::vector<Game>& getAllGames() const;

    std::vector<Game> getGamesReleasedAfter(const Date& date) const;

    /**
     * @brief Top n games by user review, highest first. Ties keep load order.
     * @throws std::invalid_argument if n <= 0
     */
    std::vector<Game> getTopNUserRatedGames(int n) const;

    std::set<int> getYearsWithTopScoringGames(int minimalScore) const;

    // Names joined with ", ". Empty string if nothing was released that year.
    std::string getAllNamesOfGamesReleasedIn(int year) const;

    /**
     * @brief Best user-rated game on a platform. Ties go to the earliest loaded game.
     * @throws GameNotFoundException if platform is empty or has no games
     */
    Game getHighestUserRatedGameByPlatform(const std::string& platform) const;

    std::map<std::string, std::unordered_set<Game>> getAllGamesByPlatform() const;

    /**
     * @brief Years between the platform's first and last release.
     *
     * Returns 1 when both fall in the same year, and 0 for a blank platform
     * or one without any games.
     */
    int getYearsActive(const std::string& platform) const;

    // Games whose summary contains every keyword (case-sensitive substring match).
    KeywordSearchResult getGamesSimilarTo(const std::vector<std::string>& keywords) const;

    const LoadReport& getLoadReport() const;

private:
    std::vector<Game> games_;
    LoadReport loadReport_;

    void load(std::istream& input, const GameLoader& loader);
};

#endif // GAME_CATALOG_H
