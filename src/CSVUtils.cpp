#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char bom[3] = {0xEF, 0xBB, 0xBF};
    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;

    // Partial match: give the bytes back.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed, size_t* consumedLines) {
    if (malformed) *malformed = false;
    if (consumedLines) *consumedLines = 0;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool lastPushedFieldQuoted = false;
    bool hadDelimiter = false;
    bool sawData = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        lastPushedFieldQuoted = fieldQuoted;
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r' || c == '\n') {
                if (c == '\r' && is.peek() == '\n') is.get();
                if (consumedLines) ++(*consumedLines);
                val += '\n';
            } else {
                val += c;
            }
            continue;
        }

        if (c == '"' && trimUnquotedField(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawData = true;
        } else if (c == delimiter) {
            pushField();
            hadDelimiter = true;
            sawData = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            if (consumedLines) ++(*consumedLines);
            break;
        } else {
            val += c;
            sawData = true;
        }
    }

    if (inQuotes && malformed) *malformed = true;
    if (!sawData && val.empty()) return {};
    pushField();

    // A lone unquoted field that trims to nothing is a blank line.
    if (row.size() == 1 && row[0].empty() && !lastPushedFieldQuoted && !hadDelimiter) {
        return {};
    }
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) {
            out[i] = "column_" + std::to_string(i + 1);
        }

        const std::string original = out[i];
        if (seen.count(out[i]) > 0) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix)) > 0) ++suffix;
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}
} // namespace CSVUtils
