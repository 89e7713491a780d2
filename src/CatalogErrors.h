#ifndef CATALOG_ERRORS_H
#define CATALOG_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @brief Thrown when a catalog line has the right shape but unusable content
 * (bad release date, non-numeric score). Aborts catalog construction.
 */
class InvalidGameDataException : public std::runtime_error {
public:
    explicit InvalidGameDataException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Thrown by lookups that must return exactly one game and found none.
 */
class GameNotFoundException : public std::runtime_error {
public:
    explicit GameNotFoundException(const std::string& message)
        : std::runtime_error(message) {}
};

#endif // CATALOG_ERRORS_H
