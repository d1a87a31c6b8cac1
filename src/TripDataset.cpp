#include "TripDataset.h"

#include "CSVUtils.h"
#include "HackneyExceptions.h"

#include <fstream>
#include <iostream>
#include <utility>

TripDataset::TripDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

void TripDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Hackney::IOException("Could not open file: " + filename_);
    load(in);
    if (in.bad()) throw Hackney::IOException("Read failure while loading: " + filename_);
}

void TripDataset::load(std::istream& in) {
    header_.clear();
    records_.clear();
    malformedRows_ = 0;

    CSVUtils::skipBOM(in);
    CSVUtils::LineResult headerLine = CSVUtils::parseCSVLine(in, delimiter_);
    if (headerLine.malformed || headerLine.limitExceeded || headerLine.fields.empty()) {
        throw Hackney::DatasetException("Malformed or empty CSV header in " + filename_);
    }
    header_ = CSVUtils::normalizeHeader(headerLine.fields);

    size_t lineNo = headerLine.consumedLines;
    while (in.peek() != EOF) {
        const size_t rowStart = lineNo + 1;
        CSVUtils::LineResult line = CSVUtils::parseCSVLine(in, delimiter_);
        lineNo += line.consumedLines;

        if (line.fields.empty()) continue;
        if (line.malformed || line.limitExceeded || line.fields.size() != header_.size()) {
            ++malformedRows_;
            continue;
        }

        TripRecord record(rowStart);
        for (size_t c = 0; c < header_.size(); ++c) {
            record.set(header_[c], std::move(line.fields[c]));
        }
        // Re-loading a cleaned table restores the typed outlier flag.
        if (record.has(TripFields::kOutlierFlag)) {
            if (auto flag = parseOutlierFlag(record.get(TripFields::kOutlierFlag))) {
                record.setOutlier(*flag);
            }
        }
        records_.push_back(std::move(record));

        if (progressInterval_ > 0 && records_.size() % progressInterval_ == 0) {
            std::cout << "[Hackney][Load] Processed " << records_.size() << " rows...\n";
        }
    }
}

std::vector<TripRecord> TripDataset::takeRecords() {
    std::vector<TripRecord> out = std::move(records_);
    records_.clear();
    return out;
}

void TripDataset::writeCSV(const std::string& path,
                           const std::vector<std::string>& columns,
                           const std::vector<TripRecord>& records,
                           char delimiter) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw Hackney::IOException("Could not open output file: " + path);

    CSVUtils::writeRow(out, columns, delimiter);
    std::vector<std::string> row(columns.size());
    for (const auto& record : records) {
        for (size_t c = 0; c < columns.size(); ++c) {
            row[c] = record.get(columns[c]);
        }
        CSVUtils::writeRow(out, row, delimiter);
    }
    out.flush();
    if (!out.good()) throw Hackney::IOException("Failed while writing output file: " + path);
}
