#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC 4180 style tokenization and writing. Values stay raw strings; this
// module never interprets field contents.
struct ParseLimits {
	size_t maxFieldBytes = 1024 * 1024;        // 1 MiB
	size_t maxRecordBytes = 16 * 1024 * 1024;  // 16 MiB
};

struct LineResult {
	std::vector<std::string> fields;
	size_t consumedLines = 0;
	bool malformed = false;      // unterminated quote
	bool limitExceeded = false;
};

void skipBOM(std::istream& is);
LineResult parseCSVLine(std::istream& is, char delimiter, const ParseLimits& limits = ParseLimits{});
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string escapeField(const std::string& value, char delimiter);
void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
