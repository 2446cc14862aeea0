#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <istream>
#include <ostream>
#include <string>


///////////////////////////
///    CONFIGURATION    ///
///////////////////////////
/**
 * @brief How invalid values in a config file are treated.
 */
enum class ConfigParseMode {
    LENIENT, ///< Non-numeric text reads as 0, with a warning.
    STRICT ///< Any malformed line or value throws ConfigurationError.
};

/**
 * @brief Grid, economy and search settings read from one file.
 */
struct RunConfig {
    ScheduleConfig schedule;
    AnnealingParams annealing;
};

/**
 * @brief Read flat `key: value` settings into @p config.
 *
 * Text after `#` is a comment; keys are case-insensitive. Keys missing from
 * the input keep their current value in @p config. Unknown keys are
 * reported on @p warnings (if given) and skipped. Lines without ':' and
 * malformed values are reported the same way in LENIENT mode (numbers read
 * as 0) and throw ConfigurationError in STRICT mode.
 *
 * Recognized keys: classroom_count, day_count, slot_count,
 * max_participants_per_lesson, ticket_price, hourly_pay, presence_bonus,
 * rental_cost, alpha, initial_temperature, iterations_per_temperature,
 * min_temperature, epsilon, max_stagnant_epochs,
 * use_greedy_initial_placement, allowed_neighbor_move_types (comma list of
 * relocate/swap), seed, rollback_policy (rollback/keep_mutation).
 */
void parseConfig(std::istream& in,
                 RunConfig& config,
                 ConfigParseMode mode = ConfigParseMode::LENIENT,
                 std::ostream* warnings = nullptr);

/**
 * @brief Open @p path and read it with parseConfig().
 *
 * Throws ConfigurationError if the file cannot be opened.
 */
RunConfig loadConfigFile(const std::string& path,
                         ConfigParseMode mode = ConfigParseMode::LENIENT,
                         std::ostream* warnings = nullptr);
