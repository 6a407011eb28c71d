#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization only; column roles are interpreted by DatabaseLoader.

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one record, honouring quoted fields, doubled quotes and embedded newlines.
 * @post Returns an empty vector at EOF or for a blank (or whitespace-only) line.
 * @param malformed Set when the record ends inside an open quote.
 * @param consumedLines Set to the number of line breaks read, including ones inside quoted fields.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      size_t* consumedLines = nullptr);

// Fills blank titles with "column_<n>" and de-duplicates repeats with a numeric suffix.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);
}
