#include "DatabaseLoader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "PlateauExceptions.h"

#include <cmath>
#include <fstream>

namespace {
enum class ColumnRole { DATAID, ASSIGNMENT, STRING, TARGET, INPUT };

ColumnRole parseRole(const std::string& raw, size_t position) {
    const std::string key = CommonUtils::toUpper(CommonUtils::trim(raw));
    if (key == "DATAID") return ColumnRole::DATAID;
    if (key == "ASSIGNMENT") return ColumnRole::ASSIGNMENT;
    if (key == "STRING") return ColumnRole::STRING;
    if (key == "TARGET") return ColumnRole::TARGET;
    if (key == "INPUT") return ColumnRole::INPUT;
    throw Plateau::DatasetException("unknown column role '" + raw + "' in column " + std::to_string(position + 1));
}

double parseCell(const std::string& cell, const std::string& column, size_t line) {
    const std::string trimmed = CommonUtils::trim(cell);
    if (trimmed.empty()) return 0.0;
    try {
        size_t pos = 0;
        const double v = std::stod(trimmed, &pos);
        if (pos == trimmed.size() && std::isfinite(v)) return v;
    } catch (const std::exception&) {
        // reported below
    }
    throw Plateau::DatasetException("line " + std::to_string(line) + ", column '" + column +
                                    "': not a finite number: " + cell);
}
} // namespace

LoadedDatabase DatabaseLoader::loadFile(const std::string& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw Plateau::IOException("could not open database file: " + path);
    }
    return load(file);
}

LoadedDatabase DatabaseLoader::load(std::istream& is) const {
    CSVUtils::skipBOM(is);

    bool malformed = false;
    size_t consumed = 0;
    const std::vector<std::string> roleRow = CSVUtils::parseCSVLine(is, delimiter_, &malformed, &consumed);
    size_t linesRead = consumed;
    if (roleRow.empty() || malformed) {
        throw Plateau::DatasetException("missing or malformed column role row");
    }
    const std::vector<std::string> titles =
        CSVUtils::normalizeHeader(CSVUtils::parseCSVLine(is, delimiter_, &malformed, &consumed));
    linesRead += consumed;
    if (malformed || titles.size() != roleRow.size()) {
        throw Plateau::DatasetException("title row has " + std::to_string(titles.size()) + " columns, role row has " +
                                        std::to_string(roleRow.size()));
    }

    std::vector<ColumnRole> roles;
    roles.reserve(roleRow.size());
    int idColumn = -1;
    int assignmentColumn = -1;
    std::vector<std::string> inputNames;
    std::vector<std::string> outputNames;
    std::vector<std::string> stringNames;
    for (size_t j = 0; j < roleRow.size(); ++j) {
        const ColumnRole role = parseRole(roleRow[j], j);
        roles.push_back(role);
        switch (role) {
            case ColumnRole::DATAID:
                if (idColumn >= 0) throw Plateau::DatasetException("more than one DATAID column");
                idColumn = static_cast<int>(j);
                break;
            case ColumnRole::ASSIGNMENT:
                if (assignmentColumn >= 0) throw Plateau::DatasetException("more than one ASSIGNMENT column");
                assignmentColumn = static_cast<int>(j);
                break;
            case ColumnRole::STRING: stringNames.push_back(titles[j]); break;
            case ColumnRole::TARGET: outputNames.push_back(titles[j]); break;
            case ColumnRole::INPUT: inputNames.push_back(titles[j]); break;
        }
    }
    if (inputNames.empty()) throw Plateau::DatasetException("database declares no INPUT columns");
    if (outputNames.empty()) throw Plateau::DatasetException("database declares no TARGET columns");

    LoadedDatabase out;
    out.data = Dataset(inputNames, outputNames, stringNames);
    out.hasAssignments = assignmentColumn >= 0;

    std::vector<double> inputs(inputNames.size());
    std::vector<double> outputs(outputNames.size());
    std::vector<std::string> strings(stringNames.size());
    while (is.peek() != EOF) {
        // Physical line the record starts on; quoted fields may span several.
        const size_t line = linesRead + 1;
        auto row = CSVUtils::parseCSVLine(is, delimiter_, &malformed, &consumed);
        linesRead += consumed;
        if (malformed) throw Plateau::DatasetException("unterminated quoted field on line " + std::to_string(line));
        if (row.empty()) continue;
        if (row.size() != roles.size()) {
            throw Plateau::DatasetException("line " + std::to_string(line) + " has " + std::to_string(row.size()) +
                                            " fields, expected " + std::to_string(roles.size()));
        }

        size_t in = 0, tg = 0, st = 0;
        for (size_t j = 0; j < row.size(); ++j) {
            switch (roles[j]) {
                case ColumnRole::INPUT: inputs[in++] = parseCell(row[j], titles[j], line); break;
                case ColumnRole::TARGET: outputs[tg++] = parseCell(row[j], titles[j], line); break;
                case ColumnRole::STRING: strings[st++] = row[j]; break;
                case ColumnRole::DATAID:
                case ColumnRole::ASSIGNMENT:
                    break;
            }
        }
        const std::string id = idColumn >= 0 ? row[static_cast<size_t>(idColumn)] : std::string();
        out.data.addRow(id, inputs, outputs, strings);
        out.assignments.push_back(assignmentColumn >= 0 ? row[static_cast<size_t>(assignmentColumn)] : std::string());
    }
    return out;
}
