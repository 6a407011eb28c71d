#pragma once
#include "Dataset.h"
#include <istream>
#include <string>
#include <vector>

struct LoadedDatabase {
    Dataset data;
    // Raw ASSIGNMENT cell per row (empty strings when the file has no ASSIGNMENT column).
    std::vector<std::string> assignments;
    bool hasAssignments = false;
};

/**
 * @brief Reads the role-annotated CSV database format.
 *
 * Row 1 declares each column's role (DATAID, ASSIGNMENT, STRING, TARGET, INPUT), row 2 holds the
 * titles, every further row is one record. TARGET columns become outputs, INPUT columns inputs,
 * STRING columns passthrough text. Blank numeric cells load as 0.
 */
class DatabaseLoader {
public:
    explicit DatabaseLoader(char delimiter = ',') : delimiter_(delimiter) {}

    /**
     * @throws Plateau::IOException when the file cannot be opened.
     * @throws Plateau::DatasetException on malformed structure or non-numeric INPUT/TARGET cells.
     */
    LoadedDatabase loadFile(const std::string& path) const;
    LoadedDatabase load(std::istream& is) const;

private:
    char delimiter_;
};
