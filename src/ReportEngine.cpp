#include "ReportEngine.h"
#include "HackneyExceptions.h"
#include <filesystem>
#include <fstream>

namespace {
std::string escapeMarkdownTableCell(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 8);
    for (char ch : value) {
        if (ch == '|') {
            escaped += "\\|";
        } else if (ch == '\n') {
            escaped += "<br>";
        } else if (ch != '\r') {
            escaped.push_back(ch);
        }
    }
    return escaped;
}

constexpr size_t kTallTableRowCap = 120;

void appendMarkdownTable(std::string& body,
                         const std::vector<std::string>& headers,
                         const std::vector<std::vector<std::string>>& rows) {
    body += "|";
    for (const auto& h : headers) {
        body += " " + escapeMarkdownTableCell(h) + " |";
    }
    body += "\n|";
    for (size_t i = 0; i < headers.size(); ++i) {
        body += " --- |";
    }
    body += "\n";

    for (const auto& row : rows) {
        body += "|";
        for (size_t i = 0; i < headers.size(); ++i) {
            body += " " + escapeMarkdownTableCell(i < row.size() ? row[i] : "") + " |";
        }
        body += "\n";
    }
    body += "\n";
}
} // namespace

void ReportEngine::addTitle(const std::string& title) {
    body_ += "# " + title + "\n\n";
}

void ReportEngine::addSection(const std::string& heading) {
    body_ += "## " + heading + "\n\n";
}

void ReportEngine::addParagraph(const std::string& text) {
    body_ += text + "\n\n";
}

void ReportEngine::addBulletList(const std::vector<std::string>& items) {
    if (items.empty()) return;
    for (const auto& item : items) {
        body_ += "- " + item + "\n";
    }
    body_ += "\n";
}

void ReportEngine::addKeyValueList(const std::vector<std::pair<std::string, std::string>>& entries) {
    if (entries.empty()) return;
    for (const auto& [key, value] : entries) {
        body_ += "- **" + key + "**: " + value + "\n";
    }
    body_ += "\n";
}

void ReportEngine::addTable(const std::string& title, const std::vector<std::string>& headers, const std::vector<std::vector<std::string>>& rows) {
    body_ += "## " + title + "\n";
    if (headers.empty()) {
        body_ += "(no columns)\n\n";
        return;
    }
    if (rows.empty()) {
        body_ += "_No rows._\n\n";
        return;
    }

    const bool tallTable = rows.size() > kTallTableRowCap;
    if (!tallTable) {
        body_ += "\n";
        appendMarkdownTable(body_, headers, rows);
        return;
    }

    body_ += "_Tall table preview shown (" + std::to_string(kTallTableRowCap) + " of " + std::to_string(rows.size()) + " rows)._\n\n";
    const std::vector<std::vector<std::string>> previewRows(rows.begin(), rows.begin() + static_cast<long>(kTallTableRowCap));
    appendMarkdownTable(body_, headers, previewRows);

    body_ += "<details>\n";
    body_ += "<summary>Show full table (" + std::to_string(rows.size()) + " rows)</summary>\n\n";
    appendMarkdownTable(body_, headers, rows);
    body_ += "</details>\n\n";
}

void ReportEngine::save(const std::string& filePath) const {
    const std::filesystem::path target(filePath);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            throw Hackney::IOException("Could not create report directory " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(filePath, std::ios::trunc);
    if (!out) throw Hackney::IOException("Could not open report file: " + filePath);
    out << body_;
    out.flush();
    if (!out.good()) throw Hackney::IOException("Failed while writing report file: " + filePath);
}
