#include "GameLoader.h"
#include "CatalogErrors.h"
#include <cctype>
#include <cmath>
#include <sstream>

static std::string trimStr(const std::string& s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

static int parseMetaScore(const std::string& text) {
    std::string trimmed = trimStr(text);
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(trimmed, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidGameDataException("Invalid meta score: \"" + text + "\"");
    }
    if (consumed != trimmed.size()) {
        throw InvalidGameDataException("Invalid meta score: \"" + text + "\"");
    }
    return value;
}

static double parseUserReview(const std::string& text) {
    std::string trimmed = trimStr(text);
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(trimmed, &consumed);
    } catch (const std::logic_error&) {
        throw InvalidGameDataException("Invalid user review: \"" + text + "\"");
    }
    if (consumed != trimmed.size() || !std::isfinite(value)) {
        throw InvalidGameDataException("Invalid user review: \"" + text + "\"");
    }
    return value;
}

GameLoader::GameLoader(const LoaderOptions& options) : options_(options) {}

std::vector<std::string> GameLoader::splitFields(const std::string& line) const {
    std::string content = line;
    if (!content.empty() && content.back() == '\r') {
        content.pop_back();
    }

    std::vector<std::string> fields;
    std::istringstream iss(content);
    std::string token;
    while (std::getline(iss, token, options_.delimiter)) {
        fields.push_back(token);
    }
    // Trailing empty fields do not count
    while (!fields.empty() && fields.back().empty()) {
        fields.pop_back();
    }
    return fields;
}

std::optional<Game> GameLoader::parseLine(const std::string& line) const {
    std::vector<std::string> fields = splitFields(line);
    if (fields.size() != kFieldCount) return std::nullopt;

    const std::string& name = fields[0];
    const std::string& platform = fields[1];
    if (name.empty() || platform.empty()) return std::nullopt;

    Date releaseDate;
    if (!parseDate(fields[2], releaseDate)) {
        throw InvalidGameDataException("Invalid release date: \"" + fields[2] + "\"");
    }

    int metaScore = parseMetaScore(fields[4]);
    double userReview = parseUserReview(fields[5]);

    return Game(name, platform, releaseDate, fields[3], metaScore, userReview);
}
