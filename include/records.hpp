#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include <istream>
#include <string>
#include <vector>


///////////////////////////
///       RECORDS       ///
///////////////////////////
/**
 * @brief One raw intake row: a person id and the category ordinals listed for them.
 */
struct RawRecord {
    int id;
    std::vector<int> categories;
};

/**
 * @brief Parse client or instructor records from a text stream.
 *
 * Format: one header line, then one `id;ordinals` line per person with the
 * ordinals separated by spaces, e.g. `7;0 3 9`. Blank lines are skipped.
 * Throws DataError (with the 1-based line number) for a missing separator,
 * a non-numeric id or ordinal, or an ordinal outside the category range.
 */
std::vector<RawRecord> parseRecords(std::istream& in);

/**
 * @brief Open @p path and parse it with parseRecords().
 *
 * Throws DataError if the file cannot be opened.
 */
std::vector<RawRecord> loadRecordsFile(const std::string& path);

std::vector<Client> toClients(const std::vector<RawRecord>& records);
std::vector<Instructor> toInstructors(const std::vector<RawRecord>& records);
