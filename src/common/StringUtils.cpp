#include "common/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace instflow {
namespace utils {

std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::vector<std::string> splitCsvRecord(const std::string& line, char delimiter) {
    std::vector<std::string> cells;
    std::string cell;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    cell.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                cell.push_back(c);
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == delimiter) {
            cells.push_back(trimCopy(cell));
            cell.clear();
        } else if (c != '\r' && c != '\n') {
            cell.push_back(c);
        }
    }
    cells.push_back(trimCopy(cell));
    return cells;
}

std::vector<std::string> splitCsvRecords(const std::string& text) {
    std::vector<std::string> records;
    std::string record;
    bool in_quotes = false;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '"') {
            // "" inside a quoted field flips twice and stays quoted
            in_quotes = !in_quotes;
        } else if (!in_quotes && (c == '\n' || c == '\r')) {
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
            records.push_back(record);
            record.clear();
            continue;
        }
        record.push_back(c);
    }
    if (!record.empty()) records.push_back(record);
    return records;
}

std::optional<double> parseLooseNumber(const std::string& text) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (char c : text) {
        if (c == ',' || c == ' ' || c == '"') continue;
        cleaned.push_back(c);
    }
    if (cleaned.empty() || cleaned == "-") {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end == cleaned.c_str() || errno == ERANGE) {
        return std::nullopt;
    }
    return value;
}

} // namespace utils
} // namespace instflow
