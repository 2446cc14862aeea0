///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "records.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static std::string trimmed(const std::string& s) {
    auto first = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto last = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    return first < last ? std::string(first, last) : std::string();
}

static int parseInt(const std::string& token, int lineNo, const char* what) {
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(token.c_str(), &end, 10);
    if (token.empty() || !end || *end != '\0') {
        throw DataError("line " + std::to_string(lineNo) + ": invalid " + what + " '" + token + "'");
    }
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        throw DataError("line " + std::to_string(lineNo) + ": " + what + " '" + token + "' out of range");
    }
    return (int)value;
}

static std::set<LessonCategory> toCategories(const std::vector<int>& ordinals) {
    std::set<LessonCategory> categories;
    for (int ordinal : ordinals) {
        categories.insert(categoryFromOrdinal(ordinal));
    }
    return categories;
}


///////////////////////////
///       RECORDS       ///
///////////////////////////
std::vector<RawRecord> parseRecords(std::istream& in) {
    std::vector<RawRecord> records;
    std::string line;
    int lineNo = 0;

    // Header row carries column names only.
    if (std::getline(in, line)) ++lineNo;

    while (std::getline(in, line)) {
        ++lineNo;
        line = trimmed(line);
        if (line.empty()) continue;

        auto sep = line.find(';');
        if (sep == std::string::npos) {
            throw DataError("line " + std::to_string(lineNo) + ": missing ';' separator");
        }

        RawRecord record;
        record.id = parseInt(trimmed(line.substr(0, sep)), lineNo, "id");

        std::istringstream ordinals(line.substr(sep + 1));
        std::string token;
        while (ordinals >> token) {
            int ordinal = parseInt(token, lineNo, "category ordinal");
            if (ordinal < 0 || ordinal >= CATEGORY_COUNT) {
                throw DataError("line " + std::to_string(lineNo) + ": unknown category ordinal " +
                                std::to_string(ordinal));
            }
            record.categories.push_back(ordinal);
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<RawRecord> loadRecordsFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataError("cannot open records file: " + path);
    }
    return parseRecords(file);
}

std::vector<Client> toClients(const std::vector<RawRecord>& records) {
    std::vector<Client> clients;
    clients.reserve(records.size());
    for (const RawRecord& r : records) {
        clients.push_back(Client{r.id, toCategories(r.categories)});
    }
    return clients;
}

std::vector<Instructor> toInstructors(const std::vector<RawRecord>& records) {
    std::vector<Instructor> instructors;
    instructors.reserve(records.size());
    for (const RawRecord& r : records) {
        instructors.push_back(Instructor{r.id, toCategories(r.categories)});
    }
    return instructors;
}
