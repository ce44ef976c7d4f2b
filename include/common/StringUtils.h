#pragma once

#include <optional>
#include <string>
#include <vector>

namespace instflow {
namespace utils {

std::string trimCopy(std::string s);
std::string toUpperCopy(std::string s);
std::string toLowerCopy(std::string s);
bool startsWith(const std::string& value, const std::string& prefix);
bool contains(const std::string& haystack, const std::string& needle);

// Collapse runs of whitespace into single spaces and trim
std::string collapseWhitespace(const std::string& s);

// Split one CSV record; honours double quotes and "" escapes
std::vector<std::string> splitCsvRecord(const std::string& line, char delimiter = ',');

// Split CSV text into records; line breaks inside quoted fields stay in the record
std::vector<std::string> splitCsvRecords(const std::string& text);

// "1,23,456.50" -> 123456.5; nullopt when nothing numeric remains
std::optional<double> parseLooseNumber(const std::string& text);

} // namespace utils
} // namespace instflow
