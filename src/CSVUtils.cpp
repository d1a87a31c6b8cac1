#include "CSVUtils.h"

#include "CommonUtils.h"

#include <unordered_set>

namespace CSVUtils {
void skipBOM(std::istream& is) {
    if (!is.good()) return;

    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    while (matched-- > 0) is.unget();
}

namespace {
// Consumes the rest of an oversized record through its terminating newline.
void skipRestOfRecord(std::istream& is, char delimiter, bool inQuotes, bool atFieldStart, size_t& consumedLines) {
    char c;
    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                } else {
                    inQuotes = false;
                }
            } else if (c == '\n') {
                ++consumedLines;
            } else if (c == '\r' && is.peek() == '\n') {
                is.get();
                ++consumedLines;
            }
            continue;
        }
        if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++consumedLines;
            return;
        }
        if (c == '"' && atFieldStart) {
            inQuotes = true;
        } else if (c == delimiter) {
            atFieldStart = true;
        } else if (c != ' ' && c != '\t') {
            atFieldStart = false;
        }
    }
}
}

LineResult parseCSVLine(std::istream& is, char delimiter, const ParseLimits& limits) {
    LineResult result;
    if (is.peek() == EOF) return result;

    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    size_t recordBytes = 0;
    char c;

    auto pushField = [&]() {
        result.fields.push_back(fieldQuoted ? val : CommonUtils::trim(val));
        val.clear();
        fieldQuoted = false;
    };

    while (is.get(c)) {
        if (limits.maxRecordBytes > 0 && ++recordBytes > limits.maxRecordBytes) {
            result.limitExceeded = true;
            is.unget();
            break;
        }

        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\n') ++result.consumedLines;
                if (c == '\r' && is.peek() == '\n') {
                    is.get();
                    ++result.consumedLines;
                    c = '\n';
                }
                val += c;
            }
        } else if (c == '"' && CommonUtils::trim(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
            sawContent = true;
        } else if (c == delimiter) {
            pushField();
            sawContent = true;
        } else if (c == '\n' || c == '\r') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++result.consumedLines;
            break;
        } else {
            // Whitespace between a closing quote and the delimiter is padding.
            if (!(fieldQuoted && (c == ' ' || c == '\t'))) val += c;
            sawContent = true;
        }

        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) {
            result.limitExceeded = true;
            break;
        }
    }

    if (result.limitExceeded) {
        const bool atFieldStart = !fieldQuoted && CommonUtils::trim(val).empty();
        skipRestOfRecord(is, delimiter, inQuotes, atFieldStart, result.consumedLines);
        inQuotes = false;
    }

    if (is.eof() && result.consumedLines == 0) result.consumedLines = 1;
    if (inQuotes) result.malformed = true;
    if (sawContent || !val.empty()) pushField();
    return result;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = CommonUtils::trim(header[i]);
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        std::string candidate = name;
        size_t suffix = 2;
        while (seen.count(candidate)) {
            candidate = name + "_" + std::to_string(suffix++);
        }
        seen.insert(candidate);
        out.push_back(std::move(candidate));
    }
    return out;
}

std::string escapeField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos ||
                             value.find('\r') != std::string::npos;
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) os << delimiter;
        os << escapeField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
