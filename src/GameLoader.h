#ifndef GAME_LOADER_H
#define GAME_LOADER_H

#include <optional>
#include <string>
#include <vector>
#include "CatalogConfig.h"
#include "Game.h"

/**
 * @brief Turns one delimited catalog line into a Game.
 *
 * Field order: name, platform, release date (dd-MMM-yyyy), summary,
 * meta score, user review. No quoting or escaping.
 */
class GameLoader {
public:
    static constexpr std::size_t kFieldCount = 6;

    GameLoader() = default;
    explicit GameLoader(const LoaderOptions& options);

    /**
     * @brief Parse a single line
     * @return the game, or std::nullopt when the line does not have the
     *         expected field layout
     * @throws InvalidGameDataException if a date or score field cannot be parsed
     */
    std::optional<Game> parseLine(const std::string& line) const;

    // Strips one trailing '\r'; trailing empty fields are dropped.
    std::vector<std::string> splitFields(const std::string& line) const;

private:
    LoaderOptions options_;
};

#endif // GAME_LOADER_H
