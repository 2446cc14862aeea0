#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Problem cannot be scheduled with the given parameters.
 *
 * Raised for insufficient grid capacity, categories with demand but no
 * usable instructor, invalid grid dimensions and invalid search parameters.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief A grid operation was asked for on a grid that cannot support it.
 *
 * E.g. relocating a lesson in a grid with no lessons or no free cells.
 */
class DegenerateStateError : public std::runtime_error {
public:
    explicit DegenerateStateError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Malformed input records (unknown category ordinals, bad ids, ...).
 */
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& msg) : std::runtime_error(msg) {}
};
